#include "cbor/utils/hex.hpp"

#include <cctype>

namespace cbor::utils {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

[[nodiscard]] int hex_value_(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_separator_(unsigned char c) noexcept {
    if (std::isspace(c) != 0) {
        return true;
    }
    switch (c) {
    case ',':
    case ';':
    case ':':
    case '-':
    case '_':
    case '|':
    case '[':
    case ']':
    case '\'':
    case '"':
        return true;
    default:
        return false;
    }
}

} // namespace

std::string to_hex(cbor::core::bytes_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        out.push_back(kHexDigits[(b >> 4) & 0x0F]);
        out.push_back(kHexDigits[b & 0x0F]);
    }
    return out;
}

std::error_code parse_hex(std::string_view text,
                          std::vector<cbor::core::byte> &out) noexcept {
    out.clear();

    int hi_nibble = -1;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (is_separator_(c)) {
            continue;
        }

        // 0x/0X 前缀只在一个字节的起始位置识别，避免吞掉 "...0" 后的内容。
        if (hi_nibble < 0 && c == '0' && (i + 1) < text.size() &&
            (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            ++i;
            continue;
        }

        const int v = hex_value_(c);
        if (v < 0) {
            out.clear();
            return cbor::core::make_error_code(cbor::core::errc::invalid_argument);
        }
        if (hi_nibble < 0) {
            hi_nibble = v;
            continue;
        }
        out.push_back(static_cast<cbor::core::byte>((hi_nibble << 4) | v));
        hi_nibble = -1;
    }

    // 奇数个 nibble 视为非法输入。
    if (hi_nibble >= 0) {
        out.clear();
        return cbor::core::make_error_code(cbor::core::errc::invalid_argument);
    }
    return {};
}

} // namespace cbor::utils
