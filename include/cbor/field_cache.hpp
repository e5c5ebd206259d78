#pragma once

#include "cbor/value.hpp"

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace cbor {

/**
 * @brief 记录类型中一个可编码字段：有效名、槽位、omit-if-empty 标记。
 */
struct FieldDescriptor final {
  std::string name;
  std::size_t slot{0};
  bool omit_empty{false};
  friend bool operator==(const FieldDescriptor&, const FieldDescriptor&) = default;
};

using FieldList = std::vector<FieldDescriptor>;

/**
 * @brief 字段标签解析结果。
 *
 * 标签语法：`-` 表示总是忽略；否则第一个逗号前为重命名（空表示沿用声明名），
 * 逗号后的选项中只识别 `omitempty`。
 */
struct FieldTag final {
  std::string_view name;
  bool skip{false};
  bool omit_empty{false};
};

[[nodiscard]] FieldTag parse_tag(std::string_view tag) noexcept;

/**
 * @brief 从声明列表计算字段描述（纯函数，不访问缓存）。
 *
 * 跳过不可见字段与 `-` 标签字段；保留字段的 slot 为其在声明列表中的下标。
 */
[[nodiscard]] FieldList extract_fields(std::span<const FieldDecl> declared);

/**
 * @brief 记录类型 → 字段描述列表 的进程级缓存。
 *
 * 线程模型：
 * - 查询持共享锁；未命中时在锁外计算，再持独占锁插入；
 * - 两个线程并发填充同一类型是允许的（计算是幂等的），先插入者胜出；
 * - 条目只增不减，空列表也会被缓存。
 */
class FieldCache final {
 public:
  FieldCache() = default;

  FieldCache(const FieldCache&) = delete;
  FieldCache& operator=(const FieldCache&) = delete;

  [[nodiscard]] std::shared_ptr<const FieldList> fields_of(const Record& record);

  [[nodiscard]] bool contains(std::type_index type) const;
  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::type_index, std::shared_ptr<const FieldList>> entries_;
};

/**
 * @brief 进程生命周期内的默认缓存（cbor::marshal 使用）。
 */
[[nodiscard]] FieldCache& default_field_cache() noexcept;

}  // namespace cbor
