#pragma once
// ============================================================================
// SIGNGATE - Encoding Helpers
// ============================================================================
// Base64 (standard alphabet, no line wrapping), URL and JSON string encoding
// ============================================================================

#include <optional>
#include <string>
#include <string_view>

namespace signgate::utils {

/// Standard base64 with padding, no newlines
[[nodiscard]] std::string base64_encode(std::string_view data);

/// Decode standard base64. Whitespace is ignored. nullopt on malformed input.
[[nodiscard]] std::optional<std::string> base64_decode(std::string_view encoded);

/// RFC 3986 percent-encoding of everything outside the unreserved set
[[nodiscard]] std::string url_encode(std::string_view value);

/// Percent-decoding; '+' is left as-is. nullopt on a truncated or bad escape.
[[nodiscard]] std::optional<std::string> url_decode(std::string_view value);

/// Escape a value for inclusion inside a JSON string literal
[[nodiscard]] std::string json_escape(std::string_view value);

/// {"error":"<message>"}
[[nodiscard]] std::string error_json(std::string_view message);

}  // namespace signgate::utils
