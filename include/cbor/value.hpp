#pragma once

#include "cbor/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <typeindex>
#include <utility>
#include <variant>
#include <vector>

namespace cbor {

class Value;
class Record;
class Marshaler;

using Array = std::vector<Value>;
using Map = std::vector<std::pair<Value, Value>>;

struct Null final {
  friend bool operator==(const Null&, const Null&) = default;
};

struct Undefined final {
  friend bool operator==(const Undefined&, const Undefined&) = default;
};

struct Bool final {
  bool value{false};
  friend bool operator==(const Bool&, const Bool&) = default;
};

struct Int final {
  std::int64_t value{0};
  friend bool operator==(const Int&, const Int&) = default;
};

struct Uint final {
  std::uint64_t value{0};
  friend bool operator==(const Uint&, const Uint&) = default;
};

struct F32 final {
  float value{0.0f};
};

struct F64 final {
  double value{0.0};
};

struct Text final {
  std::string value;
  friend bool operator==(const Text&, const Text&) = default;
};

struct Bytes final {
  std::vector<byte> value;
  friend bool operator==(const Bytes&, const Bytes&) = default;
};

struct RecordRef final {
  std::shared_ptr<const Record> record;
  friend bool operator==(const RecordRef&, const RecordRef&) = default;
};

struct Extension final {
  std::shared_ptr<const Marshaler> marshaler;
  friend bool operator==(const Extension&, const Extension&) = default;
};

/**
 * @brief 编码器没有规则的宿主类型（函数对象、复数等），编码时报 unsupported_type。
 */
struct Opaque final {
  std::string type_name;
  friend bool operator==(const Opaque&, const Opaque&) = default;
};

enum class value_kind : std::uint8_t {
  null,
  undefined,
  boolean,
  integer,
  uinteger,
  float32,
  float64,
  text,
  bytes,
  array,
  map,
  record,
  extension,
  opaque,
};

/**
 * @brief 待编码的值（闭合的种类集合，Array/Map/Record 可递归嵌套）。
 *
 * 约定：
 * - 默认构造为 Null；
 * - Map 保留插入顺序，编码时再按编码后的 key 排序；
 * - Record/Extension 以 shared_ptr 共享，指针为空时按 null 编码。
 */
class Value final {
 public:
  using storage_type =
    std::variant<Null, Undefined, Bool, Int, Uint, F32, F64, Text, Bytes, Array, Map, RecordRef, Extension, Opaque>;

  Value() noexcept = default;

  explicit Value(Null v) noexcept;
  explicit Value(Undefined v) noexcept;
  explicit Value(Bool v) noexcept;
  explicit Value(Int v) noexcept;
  explicit Value(Uint v) noexcept;
  explicit Value(F32 v) noexcept;
  explicit Value(F64 v) noexcept;
  explicit Value(Text v);
  explicit Value(Bytes v);
  explicit Value(Array v);
  explicit Value(Map v);
  explicit Value(RecordRef v);
  explicit Value(Extension v);
  explicit Value(Opaque v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] value_kind kind() const noexcept { return static_cast<value_kind>(storage_.index()); }
  [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<Null>(storage_); }

  static Value null();
  static Value undefined();
  static Value boolean(bool value);
  static Value integer(std::int64_t value);
  static Value uinteger(std::uint64_t value);
  static Value float32(float value);
  static Value float64(double value);
  static Value text(std::string value);
  static Value bytes(std::vector<byte> value);
  static Value array(std::vector<Value> values);
  static Value map(Map entries);
  static Value record(std::shared_ptr<const Record> record);
  static Value extension(std::shared_ptr<const Marshaler> marshaler);
  static Value opaque(std::string type_name);

  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_;
};

/**
 * @brief omit-if-empty 语义下的“空值”判定。
 *
 * 空：null、false、数值 0、长度为 0 的 text/bytes/array/map。
 * 其余（含 record、extension、undefined）一律非空。
 * 记录字段若为非空引用（指针、optional 等），由 Record::holds_reference 判定为非空，不经过本函数。
 */
[[nodiscard]] bool is_empty(const Value& value) noexcept;

[[nodiscard]] const char* kind_name(value_kind kind) noexcept;

/**
 * @brief 记录类型声明的一个字段（提取前的原始声明）。
 */
struct FieldDecl final {
  std::string name;
  std::string tag;
  bool exported{true};
};

/**
 * @brief 用户记录类型的运行时视图（由 record_traits<T> 自动适配，见 cbor/record.hpp）。
 */
class Record {
 public:
  virtual ~Record() = default;

  [[nodiscard]] virtual std::type_index type() const noexcept = 0;
  [[nodiscard]] virtual std::string type_name() const = 0;
  [[nodiscard]] virtual std::vector<FieldDecl> declared_fields() const = 0;

  // slot 为字段在声明列表中的下标。
  [[nodiscard]] virtual Value field(std::size_t slot) const = 0;

  // slot 处成员是否为非空的指针/optional/智能指针；为 true 时 omit-if-empty 不省略该字段。
  [[nodiscard]] virtual bool holds_reference(std::size_t slot) const = 0;
};

/**
 * @brief 扩展钩子：类型自行产出完整的 CBOR 字节。
 *
 * 编码器原样追加 out 中的内容，不做任何校验；返回非零 error_code 时整个编码失败，
 * 错误会连同类型名一起包装为 errc::extension_failed。
 */
class Marshaler {
 public:
  virtual ~Marshaler() = default;

  virtual std::error_code marshal_cbor(std::vector<byte>& out) const = 0;
};

}  // namespace cbor
