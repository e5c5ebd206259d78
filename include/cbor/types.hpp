#pragma once

#include "cbor/core/common.hpp"

#include <cstddef>
#include <cstdint>

namespace cbor {

using byte = cbor::core::byte;
using bytes_view = cbor::core::bytes_view;
using mutable_bytes_view = cbor::core::mutable_bytes_view;

/**
 * @brief CBOR 数据项的 3-bit 主类型（RFC 7049 / RFC 8949）。
 *
 * 编码时首字节（initial byte）布局：
 * - 高 3 位：major_type
 * - 低 5 位：additional info（0..23 直接承载数值；24..27 表示后续 1/2/4/8 字节大端数值）
 */
enum class major_type : std::uint8_t {
  unsigned_integer = 0,
  negative_integer = 1,
  byte_string = 2,
  text_string = 3,
  array = 4,
  map = 5,
  tag = 6,
  simple = 7,  // 简单值与浮点共用
};

/**
 * @brief additional info 中的转义码。
 */
enum class additional_info : std::uint8_t {
  one_byte = 24,
  two_bytes = 25,
  four_bytes = 26,
  eight_bytes = 27,
  indefinite = 31,
};

/**
 * @brief 主类型 7 下的固定 5-bit 编码。
 *
 * float16 保留但本库不会输出（半精度不在支持范围内）。
 */
enum class simple : std::uint8_t {
  false_ = 20,
  true_ = 21,
  null = 22,
  undefined = 23,
  float16 = 25,
  float32 = 26,
  float64 = 27,
  break_ = 31,
};

inline constexpr std::uint8_t kMaxInlineValue = 23;

}  // namespace cbor
