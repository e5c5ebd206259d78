#include "cbor/encoder.hpp"

#include "cbor/core/error.hpp"
#include "cbor/core/log.hpp"
#include "cbor/head.hpp"
#include "cbor/utf8.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <typeinfo>

#include <spdlog/spdlog.h>

namespace cbor {
namespace {

class cbor_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "cbor"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::unsupported_type:
        return "unsupported type";
      case errc::unsupported_value:
        return "unsupported value";
      case errc::invalid_text:
        return "invalid utf-8 text";
      case errc::extension_failed:
        return "extension encoder failed";
      default:
        return "unknown cbor error";
    }
  }
};

// 已编码的 key 与尚未编码的 value。
struct KeyedEntry final {
  std::vector<byte> key;
  const Value* value{nullptr};
};

struct RecordEntry final {
  std::vector<byte> key;
  Value value;
};

[[nodiscard]] bool key_less(key_order order, const std::vector<byte>& a, const std::vector<byte>& b) noexcept {
  if (order == key_order::length_first && a.size() != b.size()) {
    return a.size() < b.size();
  }
  return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
}

// 排序后相邻 key 相同即为重复（不同的源 key 编码结果相同）。
template <class Entry>
Error sort_entries(key_order order, std::vector<Entry>& entries) {
  std::sort(entries.begin(), entries.end(), [order](const Entry& a, const Entry& b) {
    return key_less(order, a.key, b.key);
  });
  const auto dup = std::adjacent_find(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
    return a.key == b.key;
  });
  if (dup != entries.end()) {
    return Error(make_error_code(errc::unsupported_value), "duplicate map key");
  }
  return {};
}

class EncodeState final {
 public:
  EncodeState(FieldCache& cache, const EncodeOptions& options, std::vector<byte>& out) noexcept
    : cache_(cache), options_(options), w_(out) {}

  Error encode_value(const Value& value, std::size_t depth);

 private:
  Error encode_float32(float f);
  Error encode_float64(double f);
  Error encode_text(const std::string& s);
  Error encode_array(const Array& values, std::size_t depth);
  Error encode_map(const Map& entries, std::size_t depth);
  Error encode_record(const Record& record, std::size_t depth);
  Error encode_extension(const Marshaler& marshaler);

  // 在独立缓冲区中编码 key（map 排序需要先拿到每个 key 的字节）。
  Error encode_detached(const Value& value, std::size_t depth, std::vector<byte>& out);

  FieldCache& cache_;
  const EncodeOptions& options_;
  ItemWriter w_;
};

Error EncodeState::encode_value(const Value& value, std::size_t depth) {
  if (depth > options_.max_depth) {
    return Error(make_error_code(errc::unsupported_value),
                 "nesting depth exceeds " + std::to_string(options_.max_depth));
  }

  return std::visit(
    [&](const auto& v) -> Error {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Null>) {
        w_.write_simple(simple::null);
        return {};
      } else if constexpr (std::is_same_v<T, Undefined>) {
        w_.write_simple(simple::undefined);
        return {};
      } else if constexpr (std::is_same_v<T, Bool>) {
        w_.write_simple(v.value ? simple::true_ : simple::false_);
        return {};
      } else if constexpr (std::is_same_v<T, Int>) {
        // 负数按 -1 - i 存放，使 INT64_MIN 也能表示。
        if (v.value < 0) {
          w_.write_head(major_type::negative_integer, static_cast<std::uint64_t>(-1 - v.value));
        } else {
          w_.write_head(major_type::unsigned_integer, static_cast<std::uint64_t>(v.value));
        }
        return {};
      } else if constexpr (std::is_same_v<T, Uint>) {
        w_.write_head(major_type::unsigned_integer, v.value);
        return {};
      } else if constexpr (std::is_same_v<T, F32>) {
        return encode_float32(v.value);
      } else if constexpr (std::is_same_v<T, F64>) {
        return encode_float64(v.value);
      } else if constexpr (std::is_same_v<T, Text>) {
        return encode_text(v.value);
      } else if constexpr (std::is_same_v<T, Bytes>) {
        w_.write_head(major_type::byte_string, v.value.size());
        w_.write_bytes(bytes_view{v.value.data(), v.value.size()});
        return {};
      } else if constexpr (std::is_same_v<T, Array>) {
        return encode_array(v, depth);
      } else if constexpr (std::is_same_v<T, Map>) {
        return encode_map(v, depth);
      } else if constexpr (std::is_same_v<T, RecordRef>) {
        if (!v.record) {
          w_.write_simple(simple::null);
          return {};
        }
        return encode_record(*v.record, depth);
      } else if constexpr (std::is_same_v<T, Extension>) {
        if (!v.marshaler) {
          w_.write_simple(simple::null);
          return {};
        }
        return encode_extension(*v.marshaler);
      } else {
        static_assert(std::is_same_v<T, Opaque>);
        return Error(make_error_code(errc::unsupported_type), v.type_name);
      }
    },
    value.storage());
}

Error EncodeState::encode_float32(float f) {
  if (std::isnan(f)) {
    return Error(make_error_code(errc::unsupported_value), "NaN");
  }
  // 32 位值按原位模式输出（-0.0f 保持为 fa80000000），只有 64 位值做 ±0 归一。
  w_.write_float32(f);
  return {};
}

Error EncodeState::encode_float64(double f) {
  if (std::isnan(f)) {
    return Error(make_error_code(errc::unsupported_value), "NaN");
  }
  if (f == 0.0) {
    w_.write_float32(0.0f);
    return {};
  }
  // 超出 float 有限范围的值直接走 8 字节（窄化转换在范围外是未定义行为）。
  if (std::isinf(f) || std::fabs(f) <= static_cast<double>(std::numeric_limits<float>::max())) {
    const auto narrowed = static_cast<float>(f);
    if (static_cast<double>(narrowed) == f) {
      w_.write_float32(narrowed);
      return {};
    }
  }
  w_.write_float64(f);
  return {};
}

Error EncodeState::encode_text(const std::string& s) {
  if (!is_valid_utf8(s)) {
    return Error(make_error_code(errc::invalid_text), s);
  }
  w_.write_head(major_type::text_string, s.size());
  w_.write_bytes(bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()});
  return {};
}

Error EncodeState::encode_array(const Array& values, std::size_t depth) {
  w_.write_head(major_type::array, values.size());
  for (const auto& child : values) {
    auto err = encode_value(child, depth + 1);
    if (err) {
      return err;
    }
  }
  return {};
}

Error EncodeState::encode_map(const Map& entries, std::size_t depth) {
  std::vector<KeyedEntry> keyed;
  keyed.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    KeyedEntry entry{{}, &value};
    auto err = encode_detached(key, depth + 1, entry.key);
    if (err) {
      return err;
    }
    keyed.push_back(std::move(entry));
  }

  auto err = sort_entries(options_.keys, keyed);
  if (err) {
    return err;
  }

  w_.write_head(major_type::map, keyed.size());
  for (const auto& entry : keyed) {
    w_.write_bytes(bytes_view{entry.key.data(), entry.key.size()});
    err = encode_value(*entry.value, depth + 1);
    if (err) {
      return err;
    }
  }
  return {};
}

Error EncodeState::encode_record(const Record& record, std::size_t depth) {
  const auto fields = cache_.fields_of(record);

  std::vector<RecordEntry> present;
  present.reserve(fields->size());
  for (const auto& field : *fields) {
    auto value = record.field(field.slot);
    if (field.omit_empty && !record.holds_reference(field.slot) && is_empty(value)) {
      continue;
    }
    if (!is_valid_utf8(field.name)) {
      return Error(make_error_code(errc::invalid_text), field.name);
    }
    RecordEntry entry{{}, std::move(value)};
    entry.key.reserve(head_size(field.name.size()) + field.name.size());
    ItemWriter key_writer(entry.key);
    key_writer.write_head(major_type::text_string, field.name.size());
    key_writer.write_bytes(bytes_view{reinterpret_cast<const byte*>(field.name.data()), field.name.size()});
    present.push_back(std::move(entry));
  }

  if (options_.record_keys == record_key_order::sorted) {
    auto err = sort_entries(options_.keys, present);
    if (err) {
      return err;
    }
  }

  // 头部计数为实际输出的字段数，而非声明字段数。
  w_.write_head(major_type::map, present.size());
  for (const auto& entry : present) {
    w_.write_bytes(bytes_view{entry.key.data(), entry.key.size()});
    auto err = encode_value(entry.value, depth + 1);
    if (err) {
      return err;
    }
  }
  return {};
}

Error EncodeState::encode_extension(const Marshaler& marshaler) {
  std::vector<byte> encoded;
  const auto ec = marshaler.marshal_cbor(encoded);
  if (ec) {
    return Error(make_error_code(errc::extension_failed), core::demangle(typeid(marshaler).name()), ec);
  }
  // 钩子输出按原样信任，不做校验或规范化。
  w_.write_bytes(bytes_view{encoded.data(), encoded.size()});
  return {};
}

Error EncodeState::encode_detached(const Value& value, std::size_t depth, std::vector<byte>& out) {
  EncodeState nested(cache_, options_, out);
  return nested.encode_value(value, depth);
}

}  // namespace

const std::error_category& error_category() noexcept {
  static cbor_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

Error::Error(std::error_code code, std::string subject, std::error_code cause)
  : code_(code), subject_(std::move(subject)), cause_(cause) {}

std::string Error::message() const {
  if (!code_) {
    return "ok";
  }
  if (code_.category() == error_category()) {
    switch (static_cast<errc>(code_.value())) {
      case errc::unsupported_type:
        return "cbor: unsupported type: " + subject_;
      case errc::unsupported_value:
        return "cbor: unsupported value: " + subject_;
      case errc::invalid_text:
        return "cbor: string is not valid UTF-8: " + subject_;
      case errc::extension_failed:
        return "cbor: error calling marshal_cbor for type " + subject_ + ": " + cause_.message();
      default:
        break;
    }
  }
  std::string out = "cbor: " + code_.message();
  if (!subject_.empty()) {
    out += ": ";
    out += subject_;
  }
  return out;
}

Encoder::Encoder(FieldCache& cache, EncodeOptions options) noexcept : cache_(&cache), options_(options) {}

Error Encoder::encode(const Value& value, std::vector<byte>& out) const {
  const auto offset = out.size();
  EncodeState state(*cache_, options_, out);
  auto err = state.encode_value(value, 0);
  if (err) {
    out.resize(offset);
    if (core::debug_enabled()) {
      spdlog::debug("cbor: encode of {} value failed: {}", kind_name(value.kind()), err.message());
    }
  }
  return err;
}

std::pair<Error, std::vector<byte>> Encoder::marshal(const Value& value) const {
  std::vector<byte> out;
  auto err = encode(value, out);
  if (err) {
    return {std::move(err), {}};
  }
  return {Error{}, std::move(out)};
}

std::pair<Error, std::vector<byte>> marshal(const Value& value) {
  return Encoder().marshal(value);
}

Error encode_to(mutable_bytes_view out, const Value& value, std::size_t& written) {
  written = 0;
  auto [err, encoded] = marshal(value);
  if (err) {
    return err;
  }
  if (encoded.size() > out.size()) {
    return Error(core::make_error_code(core::errc::buffer_overflow),
                 "need " + std::to_string(encoded.size()) + " bytes, have " + std::to_string(out.size()));
  }
  std::copy(encoded.begin(), encoded.end(), out.begin());
  written = encoded.size();
  return {};
}

}  // namespace cbor
