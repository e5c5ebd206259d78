#pragma once

#include "cbor/value.hpp"

#include <cstddef>
#include <string>

namespace cbor::utils {

/**
 * @brief Value 的 CBOR 诊断记法输出（调试/日志用途）。
 *
 * 说明：
 * - 输出形如 `[1, "a", h'0102', {"k": true}]`，贴近 RFC 8949 §8 的诊断记法；
 * - map 按插入顺序输出（不是编码后的规范顺序）；
 * - record 输出为 `TypeName{"Field": value}`，只包含可编码字段（不套用 omit-if-empty）；
 * - 默认会对超长内容做截断，避免日志被巨量 payload 淹没。
 */
struct ValueDumpOptions final {
    // 递归最大深度（0 表示只输出根节点）。
    std::size_t max_depth{16};

    // Array/Map 最大输出元素数（0 表示不限制）。
    std::size_t max_items{128};

    // Text/Bytes 最大输出字节数（0 表示不限制）。
    std::size_t max_payload_bytes{256};

    // record 前是否带类型名。
    bool show_record_type{true};
};

/**
 * @brief 将 Value 格式化为字符串。
 */
[[nodiscard]] std::string dump_value(const cbor::Value &value,
                                     ValueDumpOptions options = {});

} // namespace cbor::utils
