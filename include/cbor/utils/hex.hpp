#pragma once

#include "cbor/core/common.hpp"
#include "cbor/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cbor::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - 测试里用 RFC 7049 附录 A 的 "1903e8" 这类向量与编码结果比对；
 * - 在日志与诊断输出中以 h'...' 形式展示字节串。
 */

/**
 * @brief 紧凑小写 16 进制（无分隔符），如 {0x19, 0x03, 0xe8} -> "1903e8"。
 */
[[nodiscard]] std::string to_hex(cbor::core::bytes_view bytes);

/**
 * @brief 解析 16 进制字符串为 bytes。
 *
 * 支持：
 * - 大小写 hex；
 * - 分隔符：空白、逗号、冒号、连字符、下划线、方括号等；
 * - 可选的 0x/0X 前缀（会被忽略）。
 *
 * 失败返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<cbor::core::byte> &out) noexcept;

} // namespace cbor::utils
