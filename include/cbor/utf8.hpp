#pragma once

#include <string_view>

namespace cbor {

/**
 * @brief 检查 s 是否为良构 UTF-8。
 *
 * 拒绝：孤立续字节、截断序列、过长编码（overlong）、代理区 U+D800..U+DFFF、超出 U+10FFFF 的码点。
 */
[[nodiscard]] bool is_valid_utf8(std::string_view s) noexcept;

}  // namespace cbor
