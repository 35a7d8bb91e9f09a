#include <modelspace/payload/Unquote.hpp>

#include <cctype>
#include <optional>

namespace MS {

namespace {

[[nodiscard]] auto hex_value(char ch) -> std::optional<unsigned> {
    if (ch >= '0' && ch <= '9')
        return static_cast<unsigned>(ch - '0');
    if (ch >= 'a' && ch <= 'f')
        return static_cast<unsigned>(ch - 'a' + 10);
    if (ch >= 'A' && ch <= 'F')
        return static_cast<unsigned>(ch - 'A' + 10);
    return std::nullopt;
}

[[nodiscard]] auto is_unreserved(unsigned char ch) -> bool {
    if (std::isalnum(ch) != 0)
        return true;
    switch (ch) {
    case '-':
    case '_':
    case '.':
    case '~':
    case '!':
    case '*':
    case '\'':
    case '(':
    case ')':
        return true;
    default:
        return false;
    }
}

// Plain percent-decoding; malformed escapes are kept literally.
[[nodiscard]] auto percent_decode(std::string_view text) -> std::string {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            auto high = hex_value(text[i + 1]);
            auto low  = hex_value(text[i + 2]);
            if (high && low) {
                decoded.push_back(static_cast<char>((*high << 4) | *low));
                i += 2;
                continue;
            }
        }
        decoded.push_back(text[i]);
    }
    return decoded;
}

// Well-formed UTF-8 only: no overlong forms, surrogates or code points above
// U+10FFFF.
[[nodiscard]] auto is_valid_utf8(std::string_view text) -> bool {
    std::size_t i = 0;
    while (i < text.size()) {
        auto const lead = static_cast<unsigned char>(text[i]);
        std::size_t   length = 0;
        unsigned char low    = 0x80;
        unsigned char high   = 0xBF;
        if (lead < 0x80) {
            length = 1;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0)
                low = 0xA0;
            else if (lead == 0xED)
                high = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0)
                low = 0x90;
            else if (lead == 0xF4)
                high = 0x8F;
        } else {
            return false;
        }
        if (i + length > text.size())
            return false;
        for (std::size_t j = 1; j < length; ++j) {
            auto const next = static_cast<unsigned char>(text[i + j]);
            if (j == 1 ? (next < low || next > high) : (next >> 6) != 0x2)
                return false;
        }
        i += length;
    }
    return true;
}

} // namespace

auto encodeComponent(std::string_view text) -> std::string {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string           encoded;
    encoded.reserve(text.size());
    for (unsigned char ch : text) {
        if (is_unreserved(ch)) {
            encoded.push_back(static_cast<char>(ch));
        } else {
            encoded.push_back('%');
            encoded.push_back(digits[ch >> 4]);
            encoded.push_back(digits[ch & 0x0F]);
        }
    }
    return encoded;
}

auto decodeComponent(std::string_view text) -> std::string {
    auto decoded = percent_decode(text);
    if (decoded == text) {
        return decoded;
    }
    if (is_valid_utf8(decoded) && encodeComponent(decoded) == text) {
        return decoded;
    }
    return std::string{text};
}

auto decodePayloadStrings(nlohmann::json& value) -> void {
    if (value.is_string()) {
        value = decodeComponent(value.get_ref<std::string const&>());
    } else if (value.is_array() || value.is_object()) {
        for (auto& element : value) {
            decodePayloadStrings(element);
        }
    }
}

} // namespace MS
