#include "cbor/head.hpp"

#include <bit>
#include <stdexcept>
#include <type_traits>

namespace cbor {

template <class UInt>
void ItemWriter::write_be_uint(UInt v) {
  static_assert(std::is_unsigned_v<UInt>);
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    const auto shift = static_cast<unsigned>(8u * (sizeof(UInt) - 1u - i));
    out_.push_back(static_cast<byte>((v >> shift) & 0xFFu));
  }
}

void ItemWriter::write_head(major_type major, std::uint64_t magnitude) {
  switch (head_size(magnitude)) {
    case 1:
      out_.push_back(make_initial_byte(major, static_cast<std::uint8_t>(magnitude)));
      return;
    case 2:
      out_.push_back(make_initial_byte(major, static_cast<std::uint8_t>(additional_info::one_byte)));
      write_be_uint(static_cast<std::uint8_t>(magnitude));
      return;
    case 3:
      out_.push_back(make_initial_byte(major, static_cast<std::uint8_t>(additional_info::two_bytes)));
      write_be_uint(static_cast<std::uint16_t>(magnitude));
      return;
    case 5:
      out_.push_back(make_initial_byte(major, static_cast<std::uint8_t>(additional_info::four_bytes)));
      write_be_uint(static_cast<std::uint32_t>(magnitude));
      return;
    default:
      out_.push_back(make_initial_byte(major, static_cast<std::uint8_t>(additional_info::eight_bytes)));
      write_be_uint(magnitude);
      return;
  }
}

void ItemWriter::write_simple(simple value) {
  switch (value) {
    case simple::false_:
    case simple::true_:
    case simple::null:
    case simple::undefined:
    case simple::break_:
      out_.push_back(make_initial_byte(major_type::simple, static_cast<std::uint8_t>(value)));
      return;
    default:
      throw std::logic_error("cbor: not a simple value code");
  }
}

void ItemWriter::write_float32(float value) {
  out_.push_back(make_initial_byte(major_type::simple, static_cast<std::uint8_t>(simple::float32)));
  write_be_uint(std::bit_cast<std::uint32_t>(value));
}

void ItemWriter::write_float64(double value) {
  out_.push_back(make_initial_byte(major_type::simple, static_cast<std::uint8_t>(simple::float64)));
  write_be_uint(std::bit_cast<std::uint64_t>(value));
}

void ItemWriter::write_bytes(bytes_view data) {
  out_.insert(out_.end(), data.begin(), data.end());
}

}  // namespace cbor
