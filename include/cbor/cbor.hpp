#pragma once

#include "cbor/encoder.hpp"
#include "cbor/field_cache.hpp"
#include "cbor/head.hpp"
#include "cbor/record.hpp"
#include "cbor/types.hpp"
#include "cbor/value.hpp"

#include <type_traits>
#include <utility>
#include <vector>

namespace cbor {

/**
 * @brief 编码任意宿主值：先 to_value 再按默认编码器编码。
 */
template <class T>
  requires(!std::is_same_v<std::remove_cvref_t<T>, Value>)
[[nodiscard]] std::pair<Error, std::vector<byte>> marshal(const T& value) {
  return marshal(to_value(value));
}

template <class T>
  requires(!std::is_same_v<std::remove_cvref_t<T>, Value>)
[[nodiscard]] std::pair<Error, std::vector<byte>> marshal(const Encoder& encoder, const T& value) {
  return encoder.marshal(to_value(value));
}

}  // namespace cbor
