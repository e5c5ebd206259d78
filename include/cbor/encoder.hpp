#pragma once

#include "cbor/core/common.hpp"
#include "cbor/field_cache.hpp"
#include "cbor/value.hpp"

#include <cstddef>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace cbor {

enum class errc : int {
  ok = 0,
  unsupported_type = 1,
  unsupported_value = 2,
  invalid_text = 3,
  extension_failed = 4,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

/**
 * @brief 一次编码调用的失败详情。
 *
 * - code：错误分类（cbor::errc，或工具层的 cbor::core::errc）
 * - subject：类型名 / 非法文本 / 非法值描述
 * - cause：仅 extension_failed 使用，为钩子自身返回的 error_code
 */
class Error final {
 public:
  Error() = default;
  Error(std::error_code code, std::string subject, std::error_code cause = {});

  explicit operator bool() const noexcept { return static_cast<bool>(code_); }

  [[nodiscard]] const std::error_code& code() const noexcept { return code_; }
  [[nodiscard]] const std::string& subject() const noexcept { return subject_; }
  [[nodiscard]] const std::error_code& cause() const noexcept { return cause_; }

  [[nodiscard]] std::string message() const;

 private:
  std::error_code code_{};
  std::string subject_;
  std::error_code cause_{};
};

enum class key_order : std::uint8_t {
  bytewise = 0,     // 按编码后 key 的字节字典序（短前缀在前）
  length_first = 1, // 先比长度，再按字节比较
};

enum class record_key_order : std::uint8_t {
  sorted = 0,       // 与普通 map 相同的规范排序
  declaration = 1,  // 保持字段声明顺序
};

struct EncodeOptions final {
  // map 与（sorted 模式下的）record 的 key 排序规则。
  key_order keys{key_order::bytewise};

  // record 编码为 map 时字段的输出顺序。
  record_key_order record_keys{record_key_order::sorted};

  // 最大嵌套深度，超出时报 unsupported_value。
  std::size_t max_depth{core::kDefaultMaxDepth};
};

/**
 * @brief 规范 CBOR 编码器。
 *
 * 约定：
 * - 编码器本身无状态，可被多个线程同时使用；唯一共享的可变状态是构造时注入的 FieldCache；
 * - 任一错误会立即终止整个编码调用；encode() 失败时 out 恢复到调用前的长度。
 */
class Encoder final {
 public:
  explicit Encoder(FieldCache& cache = default_field_cache(), EncodeOptions options = {}) noexcept;

  [[nodiscard]] const EncodeOptions& options() const noexcept { return options_; }
  [[nodiscard]] FieldCache& cache() const noexcept { return *cache_; }

  /**
   * @brief 编码 value 并追加到 out。
   */
  Error encode(const Value& value, std::vector<byte>& out) const;

  /**
   * @brief 编码 value，返回 {error, bytes}；失败时 bytes 为空。
   */
  [[nodiscard]] std::pair<Error, std::vector<byte>> marshal(const Value& value) const;

 private:
  FieldCache* cache_;
  EncodeOptions options_;
};

/**
 * @brief 使用默认缓存与默认选项编码。
 */
[[nodiscard]] std::pair<Error, std::vector<byte>> marshal(const Value& value);

/**
 * @brief 编码到固定缓冲区。
 *
 * out 过小时返回 core::errc::buffer_overflow，written 置 0。
 */
Error encode_to(mutable_bytes_view out, const Value& value, std::size_t& written);

}  // namespace cbor

namespace std {
template <>
struct is_error_code_enum<cbor::errc> : true_type {};
}  // namespace std
