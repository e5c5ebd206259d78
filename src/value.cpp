#include "cbor/value.hpp"

#include <bit>
#include <type_traits>

namespace cbor {
namespace {

// 浮点比较采用“按位相等”而不是“容差比较”：
// 编码关注的是位模式是否一致，-0/+0 与 NaN 都按位区分。
bool float_bits_equal(float a, float b) noexcept {
  return std::bit_cast<std::uint32_t>(a) == std::bit_cast<std::uint32_t>(b);
}

bool double_bits_equal(double a, double b) noexcept {
  return std::bit_cast<std::uint64_t>(a) == std::bit_cast<std::uint64_t>(b);
}

bool map_equal(const Map& lhs, const Map& rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (lhs[i].first != rhs[i].first || lhs[i].second != rhs[i].second) {
      return false;
    }
  }
  return true;
}

}  // namespace

Value::Value(Null v) noexcept : storage_(v) {}
Value::Value(Undefined v) noexcept : storage_(v) {}
Value::Value(Bool v) noexcept : storage_(v) {}
Value::Value(Int v) noexcept : storage_(v) {}
Value::Value(Uint v) noexcept : storage_(v) {}
Value::Value(F32 v) noexcept : storage_(v) {}
Value::Value(F64 v) noexcept : storage_(v) {}
Value::Value(Text v) : storage_(std::move(v)) {}
Value::Value(Bytes v) : storage_(std::move(v)) {}
Value::Value(Array v) : storage_(std::move(v)) {}
Value::Value(Map v) : storage_(std::move(v)) {}
Value::Value(RecordRef v) : storage_(std::move(v)) {}
Value::Value(Extension v) : storage_(std::move(v)) {}
Value::Value(Opaque v) : storage_(std::move(v)) {}

Value Value::null() {
  return Value(Null{});
}

Value Value::undefined() {
  return Value(Undefined{});
}

Value Value::boolean(bool value) {
  return Value(Bool{value});
}

Value Value::integer(std::int64_t value) {
  return Value(Int{value});
}

Value Value::uinteger(std::uint64_t value) {
  return Value(Uint{value});
}

Value Value::float32(float value) {
  return Value(F32{value});
}

Value Value::float64(double value) {
  return Value(F64{value});
}

Value Value::text(std::string value) {
  return Value(Text{std::move(value)});
}

Value Value::bytes(std::vector<byte> value) {
  return Value(Bytes{std::move(value)});
}

Value Value::array(std::vector<Value> values) {
  return Value(std::move(values));
}

Value Value::map(Map entries) {
  return Value(std::move(entries));
}

Value Value::record(std::shared_ptr<const Record> record) {
  return Value(RecordRef{std::move(record)});
}

Value Value::extension(std::shared_ptr<const Marshaler> marshaler) {
  return Value(Extension{std::move(marshaler)});
}

Value Value::opaque(std::string type_name) {
  return Value(Opaque{std::move(type_name)});
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
  if (lhs.storage_.index() != rhs.storage_.index()) {
    return false;
  }
  return std::visit(
    [&](const auto& a) -> bool {
      using T = std::decay_t<decltype(a)>;
      const auto* b = std::get_if<T>(&rhs.storage_);
      if (!b) {
        return false;
      }
      if constexpr (std::is_same_v<T, F32>) {
        return float_bits_equal(a.value, b->value);
      } else if constexpr (std::is_same_v<T, F64>) {
        return double_bits_equal(a.value, b->value);
      } else if constexpr (std::is_same_v<T, Map>) {
        return map_equal(a, *b);
      } else {
        return a == *b;
      }
    },
    lhs.storage_);
}

bool is_empty(const Value& value) noexcept {
  return std::visit(
    [](const auto& v) -> bool {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Null>) {
        return true;
      } else if constexpr (std::is_same_v<T, Bool>) {
        return !v.value;
      } else if constexpr (std::is_same_v<T, Int> || std::is_same_v<T, Uint>) {
        return v.value == 0;
      } else if constexpr (std::is_same_v<T, F32> || std::is_same_v<T, F64>) {
        return v.value == 0;
      } else if constexpr (std::is_same_v<T, Text> || std::is_same_v<T, Bytes>) {
        return v.value.empty();
      } else if constexpr (std::is_same_v<T, Array> || std::is_same_v<T, Map>) {
        return v.empty();
      } else if constexpr (std::is_same_v<T, RecordRef>) {
        return !v.record;
      } else if constexpr (std::is_same_v<T, Extension>) {
        return !v.marshaler;
      } else {
        return false;
      }
    },
    value.storage());
}

const char* kind_name(value_kind kind) noexcept {
  switch (kind) {
    case value_kind::null:
      return "null";
    case value_kind::undefined:
      return "undefined";
    case value_kind::boolean:
      return "bool";
    case value_kind::integer:
      return "int";
    case value_kind::uinteger:
      return "uint";
    case value_kind::float32:
      return "float32";
    case value_kind::float64:
      return "float64";
    case value_kind::text:
      return "text";
    case value_kind::bytes:
      return "bytes";
    case value_kind::array:
      return "array";
    case value_kind::map:
      return "map";
    case value_kind::record:
      return "record";
    case value_kind::extension:
      return "extension";
    case value_kind::opaque:
      return "opaque";
  }
  return "unknown";
}

}  // namespace cbor
