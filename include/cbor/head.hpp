#pragma once

#include "cbor/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cbor {

[[nodiscard]] constexpr byte make_initial_byte(major_type major, std::uint8_t info) noexcept {
  return static_cast<byte>((static_cast<std::uint8_t>(major) << 5) | (info & 0x1Fu));
}

/**
 * @brief 数值 magnitude 作为头部时的规范长度（含首字节）：1/2/3/5/9。
 *
 * 这是最短编码规则的唯一来源：整数、字符串长度、数组/映射元素数都经由这里选宽度。
 */
[[nodiscard]] constexpr std::size_t head_size(std::uint64_t magnitude) noexcept {
  if (magnitude <= kMaxInlineValue) {
    return 1;
  }
  if (magnitude <= 0xFFu) {
    return 2;
  }
  if (magnitude <= 0xFFFFu) {
    return 3;
  }
  if (magnitude <= 0xFFFF'FFFFu) {
    return 5;
  }
  return 9;
}

/**
 * @brief 最短长度数据项写入器：把首字节与大端 magnitude 追加到 out。
 *
 * 注意：
 * - 本类只负责“写”，不做值合法性检查（NaN、UTF-8 等由编码器把关）；
 * - write_simple 只接受 false/true/null/undefined/break，其余码值属于调用方编程错误，
 *   抛出 std::logic_error。
 */
class ItemWriter final {
 public:
  explicit ItemWriter(std::vector<byte>& out) noexcept : out_(out) {}

  [[nodiscard]] std::size_t size() const noexcept { return out_.size(); }

  void write_head(major_type major, std::uint64_t magnitude);
  void write_simple(simple value);
  void write_float32(float value);
  void write_float64(double value);
  void write_bytes(bytes_view data);

 private:
  template <class UInt>
  void write_be_uint(UInt v);

  std::vector<byte>& out_;
};

}  // namespace cbor
