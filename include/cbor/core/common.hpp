#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <typeinfo>

namespace cbor::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// 编码嵌套深度默认上限：防止自引用记录或极深嵌套的值导致栈溢出。
inline constexpr std::size_t kDefaultMaxDepth = 512;

/**
 * @brief 返回类型的可读名称（GCC/Clang 下做 demangle，其余平台退化为 typeid().name()）。
 *
 * 仅用于错误信息与日志，不参与编码输出。
 */
[[nodiscard]] std::string demangle(const char *mangled);

template <class T>
[[nodiscard]] std::string type_name_of() {
    return demangle(typeid(T).name());
}

}  // 命名空间 cbor::core
