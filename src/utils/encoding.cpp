// ============================================================================
// SIGNGATE - Encoding Helpers Implementation
// ============================================================================

#include "signgate/utils/encoding.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <iomanip>
#include <sstream>
#include <vector>

namespace signgate::utils {

std::string base64_encode(std::string_view data) {
    if (data.empty()) {
        return {};
    }

    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(out.data()),
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::optional<std::string> base64_decode(std::string_view encoded) {
    std::string compact;
    compact.reserve(encoded.size());
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }

    if (compact.empty() || compact.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<unsigned char> out(compact.size() / 4 * 3);
    const int decoded = EVP_DecodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(compact.data()),
        static_cast<int>(compact.size()));
    if (decoded < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock keeps the bytes produced by padding; drop them
    size_t length = static_cast<size_t>(decoded);
    if (compact.back() == '=') --length;
    if (compact[compact.size() - 2] == '=') --length;

    return std::string(reinterpret_cast<const char*>(out.data()), length);
}

std::string url_encode(std::string_view value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

std::optional<std::string> url_decode(std::string_view value) {
    auto hex_digit = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '%') {
            out.push_back(value[i]);
            continue;
        }
        if (i + 2 >= value.size()) {
            return std::nullopt;
        }
        const int hi = hex_digit(value[i + 1]);
        const int lo = hex_digit(value[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

std::string json_escape(std::string_view value) {
    std::ostringstream out;
    for (char c : value) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    out << c;
                }
        }
    }
    return out.str();
}

std::string error_json(std::string_view message) {
    return R"({"error":")" + json_escape(message) + R"("})";
}

}  // namespace signgate::utils
