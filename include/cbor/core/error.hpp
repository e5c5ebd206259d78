#pragma once

#include <system_error>

namespace cbor::core {

/**
 * @brief 工具层通用错误码（hex 解析、固定缓冲区编码等）。
 *
 * 编码器自身的错误分类见 cbor/encoder.hpp 中的 cbor::errc。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
  buffer_overflow = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace cbor::core

namespace std {
template <>
struct is_error_code_enum<cbor::core::errc> : true_type {};
}  // namespace std
