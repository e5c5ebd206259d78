#include "cbor/utf8.hpp"

#include <cstddef>
#include <cstdint>

namespace cbor {
namespace {

[[nodiscard]] bool is_continuation(std::uint8_t b) noexcept {
  return (b & 0xC0u) == 0x80u;
}

}  // namespace

bool is_valid_utf8(std::string_view s) noexcept {
  const auto* p = reinterpret_cast<const std::uint8_t*>(s.data());
  const std::size_t n = s.size();
  std::size_t i = 0;

  while (i < n) {
    const std::uint8_t b0 = p[i];
    if (b0 < 0x80u) {
      ++i;
      continue;
    }

    // 首字节决定序列长度与第二字节的合法区间（排除 overlong / 代理区 / 超范围）。
    std::size_t len = 0;
    std::uint8_t lo = 0x80u;
    std::uint8_t hi = 0xBFu;
    if (b0 >= 0xC2u && b0 <= 0xDFu) {
      len = 2;
    } else if (b0 == 0xE0u) {
      len = 3;
      lo = 0xA0u;
    } else if (b0 == 0xEDu) {
      len = 3;
      hi = 0x9Fu;
    } else if (b0 >= 0xE1u && b0 <= 0xEFu) {
      len = 3;
    } else if (b0 == 0xF0u) {
      len = 4;
      lo = 0x90u;
    } else if (b0 >= 0xF1u && b0 <= 0xF3u) {
      len = 4;
    } else if (b0 == 0xF4u) {
      len = 4;
      hi = 0x8Fu;
    } else {
      return false;
    }

    if (n - i < len) {
      return false;
    }
    const std::uint8_t b1 = p[i + 1];
    if (b1 < lo || b1 > hi) {
      return false;
    }
    for (std::size_t k = 2; k < len; ++k) {
      if (!is_continuation(p[i + k])) {
        return false;
      }
    }
    i += len;
  }
  return true;
}

}  // namespace cbor
