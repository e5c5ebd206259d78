#pragma once

#include "cbor/core/common.hpp"
#include "cbor/value.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace cbor {

/**
 * @brief 记录类型声明：为 T 特化并提供 `static constexpr auto fields`。
 *
 * 示例：
 * @code
 * struct Person { std::string name; int age; std::string token; };
 *
 * template <>
 * struct cbor::record_traits<Person> {
 *   static constexpr auto fields = std::make_tuple(
 *     cbor::field("Name", &Person::name),
 *     cbor::field("Age", &Person::age, "age,omitempty"),
 *     cbor::hidden_field("token", &Person::token));
 * };
 * @endcode
 */
template <class T>
struct record_traits {};

template <class T, class M>
struct FieldBinding final {
  std::string_view name;
  M T::*member;
  std::string_view tag;
  bool exported;
};

template <class T, class M>
[[nodiscard]] constexpr FieldBinding<T, M> field(std::string_view name, M T::*member, std::string_view tag = {}) noexcept {
  return {name, member, tag, true};
}

// 不可见字段：参与声明（占用 slot），但永不编码。
template <class T, class M>
[[nodiscard]] constexpr FieldBinding<T, M> hidden_field(std::string_view name, M T::*member) noexcept {
  return {name, member, {}, false};
}

template <class T>
concept DescribedRecord = requires { record_traits<T>::fields; };

template <class T>
concept SelfEncoding = std::is_base_of_v<Marshaler, T>;

template <class T>
[[nodiscard]] Value to_value(const T& value);

namespace detail {

template <class T>
struct is_optional : std::false_type {};
template <class U>
struct is_optional<std::optional<U>> : std::true_type {};

template <class T>
struct is_unique_ptr : std::false_type {};
template <class U, class D>
struct is_unique_ptr<std::unique_ptr<U, D>> : std::true_type {};

template <class T>
struct is_shared_ptr : std::false_type {};
template <class U>
struct is_shared_ptr<std::shared_ptr<U>> : std::true_type {};

template <class T>
inline constexpr bool is_octet_v = std::is_same_v<T, std::uint8_t> || std::is_same_v<T, std::byte>;

template <class T>
concept StringLike = std::is_convertible_v<const T&, std::string_view>;

template <class T>
concept MapLike = std::ranges::range<T> && requires {
  typename T::key_type;
  typename T::mapped_type;
};

template <class T>
concept SequenceLike = std::ranges::range<T> && !MapLike<T> && !StringLike<T>;

// 指针/optional/智能指针：非空时字段永不视为空（与所指值是否为零无关）。
template <class T>
concept ReferenceLike =
  is_optional<T>::value || is_unique_ptr<T>::value || is_shared_ptr<T>::value ||
  (std::is_pointer_v<T> && !StringLike<T>);

template <class M>
[[nodiscard]] bool holds_reference(const M& member) noexcept {
  if constexpr (ReferenceLike<M>) {
    return static_cast<bool>(member);
  } else {
    return false;
  }
}

}  // namespace detail

/**
 * @brief record_traits<T> 到 Record 接口的适配。
 */
template <DescribedRecord T>
class RecordAdapter final : public Record {
 public:
  explicit RecordAdapter(std::shared_ptr<const T> object) noexcept : object_(std::move(object)) {}

  [[nodiscard]] std::type_index type() const noexcept override { return std::type_index(typeid(T)); }

  [[nodiscard]] std::string type_name() const override { return core::type_name_of<T>(); }

  [[nodiscard]] std::vector<FieldDecl> declared_fields() const override {
    std::vector<FieldDecl> out;
    out.reserve(kFieldCount);
    std::apply(
      [&](const auto&... f) {
        (out.push_back(FieldDecl{std::string(f.name), std::string(f.tag), f.exported}), ...);
      },
      record_traits<T>::fields);
    return out;
  }

  [[nodiscard]] Value field(std::size_t slot) const override {
    return field_at(slot, std::make_index_sequence<kFieldCount>{});
  }

  [[nodiscard]] bool holds_reference(std::size_t slot) const override {
    return reference_at(slot, std::make_index_sequence<kFieldCount>{});
  }

 private:
  static constexpr std::size_t kFieldCount =
    std::tuple_size_v<std::remove_cvref_t<decltype(record_traits<T>::fields)>>;

  template <std::size_t... I>
  Value field_at(std::size_t slot, std::index_sequence<I...>) const {
    Value out;
    const bool found =
      ((I == slot ? (out = to_value((*object_).*(std::get<I>(record_traits<T>::fields).member)), true) : false) || ...);
    if (!found) {
      throw std::out_of_range("cbor: record slot out of range");
    }
    return out;
  }

  template <std::size_t... I>
  bool reference_at(std::size_t slot, std::index_sequence<I...>) const {
    bool out = false;
    const bool found =
      ((I == slot ? (out = detail::holds_reference((*object_).*(std::get<I>(record_traits<T>::fields).member)), true)
                  : false) || ...);
    if (!found) {
      throw std::out_of_range("cbor: record slot out of range");
    }
    return out;
  }

  std::shared_ptr<const T> object_;
};

namespace detail {

template <class T>
Value from_shared(std::shared_ptr<T> ptr) {
  using U = std::remove_cv_t<T>;
  if (!ptr) {
    return Value::null();
  }
  if constexpr (SelfEncoding<U>) {
    return Value::extension(std::shared_ptr<const Marshaler>(std::move(ptr)));
  } else if constexpr (DescribedRecord<U>) {
    return Value::record(std::make_shared<const RecordAdapter<U>>(std::shared_ptr<const U>(std::move(ptr))));
  } else {
    return to_value(*ptr);
  }
}

}  // namespace detail

/**
 * @brief 把宿主 C++ 值转换为 Value（编译期分派）。
 *
 * 没有编码规则的类型（std::complex、std::function、long double 以及其它未声明 record_traits 的类型）
 * 转换为 Opaque，编码时报 unsupported_type 并带上类型名。
 */
template <class T>
Value to_value(const T& value) {
  using U = std::remove_cvref_t<T>;

  if constexpr (std::is_same_v<U, Value>) {
    return value;
  } else if constexpr (SelfEncoding<U>) {
    return Value::extension(std::make_shared<const U>(value));
  } else if constexpr (DescribedRecord<U>) {
    return Value::record(std::make_shared<const RecordAdapter<U>>(std::make_shared<const U>(value)));
  } else if constexpr (std::is_same_v<U, bool>) {
    return Value::boolean(value);
  } else if constexpr (std::is_enum_v<U>) {
    return to_value(static_cast<std::underlying_type_t<U>>(value));
  } else if constexpr (std::is_integral_v<U> && std::is_signed_v<U>) {
    return Value::integer(static_cast<std::int64_t>(value));
  } else if constexpr (std::is_integral_v<U>) {
    return Value::uinteger(static_cast<std::uint64_t>(value));
  } else if constexpr (std::is_same_v<U, float>) {
    return Value::float32(value);
  } else if constexpr (std::is_same_v<U, double>) {
    return Value::float64(value);
  } else if constexpr (std::is_same_v<U, std::nullptr_t>) {
    return Value::null();
  } else if constexpr (detail::StringLike<U>) {
    if constexpr (std::is_pointer_v<U>) {
      if (value == nullptr) {
        return Value::null();
      }
    }
    return Value::text(std::string(std::string_view(value)));
  } else if constexpr (detail::is_optional<U>::value) {
    return value ? to_value(*value) : Value::null();
  } else if constexpr (detail::is_shared_ptr<U>::value) {
    return detail::from_shared(value);
  } else if constexpr (detail::is_unique_ptr<U>::value) {
    return value ? to_value(*value) : Value::null();
  } else if constexpr (std::is_pointer_v<U>) {
    return value != nullptr ? to_value(*value) : Value::null();
  } else if constexpr (detail::MapLike<U>) {
    Map entries;
    entries.reserve(std::ranges::size(value));
    for (const auto& [k, v] : value) {
      entries.emplace_back(to_value(k), to_value(v));
    }
    return Value::map(std::move(entries));
  } else if constexpr (detail::SequenceLike<U>) {
    using Element = std::ranges::range_value_t<U>;
    if constexpr (detail::is_octet_v<Element>) {
      std::vector<byte> out;
      for (const auto b : value) {
        out.push_back(static_cast<byte>(b));
      }
      return Value::bytes(std::move(out));
    } else if constexpr (std::is_same_v<Element, bool>) {
      // std::vector<bool> 的元素是代理对象，逐个取 bool。
      std::vector<Value> out;
      for (const bool b : value) {
        out.push_back(Value::boolean(b));
      }
      return Value::array(std::move(out));
    } else {
      std::vector<Value> out;
      for (const auto& element : value) {
        out.push_back(to_value(element));
      }
      return Value::array(std::move(out));
    }
  } else {
    return Value::opaque(core::type_name_of<U>());
  }
}

}  // namespace cbor
