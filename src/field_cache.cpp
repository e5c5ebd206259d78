#include "cbor/field_cache.hpp"

#include "cbor/core/log.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

namespace cbor {

FieldTag parse_tag(std::string_view tag) noexcept {
  FieldTag out{};
  if (tag == "-") {
    out.skip = true;
    return out;
  }

  const auto comma = tag.find(',');
  out.name = tag.substr(0, comma);
  if (comma == std::string_view::npos) {
    return out;
  }

  auto options = tag.substr(comma + 1);
  while (!options.empty()) {
    const auto next = options.find(',');
    if (options.substr(0, next) == "omitempty") {
      out.omit_empty = true;
    }
    if (next == std::string_view::npos) {
      break;
    }
    options.remove_prefix(next + 1);
  }
  return out;
}

FieldList extract_fields(std::span<const FieldDecl> declared) {
  FieldList fields;
  fields.reserve(declared.size());
  for (std::size_t slot = 0; slot < declared.size(); ++slot) {
    const auto& decl = declared[slot];
    if (!decl.exported) {
      continue;
    }
    const auto tag = parse_tag(decl.tag);
    if (tag.skip) {
      continue;
    }
    fields.push_back(FieldDescriptor{
      tag.name.empty() ? decl.name : std::string(tag.name),
      slot,
      tag.omit_empty,
    });
  }
  return fields;
}

std::shared_ptr<const FieldList> FieldCache::fields_of(const Record& record) {
  const auto type = record.type();
  {
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(type);
    if (it != entries_.end()) {
      return it->second;
    }
  }

  const auto declared = record.declared_fields();
  auto computed = std::make_shared<const FieldList>(extract_fields(declared));

  std::unique_lock lock(mutex_);
  const auto [it, inserted] = entries_.try_emplace(type, std::move(computed));
  if (inserted && core::debug_enabled()) {
    spdlog::debug("cbor: cached {} of {} fields for record type {}",
                  it->second->size(),
                  declared.size(),
                  record.type_name());
  }
  return it->second;
}

bool FieldCache::contains(std::type_index type) const {
  std::shared_lock lock(mutex_);
  return entries_.find(type) != entries_.end();
}

std::size_t FieldCache::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

FieldCache& default_field_cache() noexcept {
  static FieldCache cache;
  return cache;
}

}  // namespace cbor
