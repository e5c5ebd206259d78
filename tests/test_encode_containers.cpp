#include "cbor/cbor.hpp"
#include "cbor/utils/hex.hpp"

#include "test_main.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace {

using cbor::Value;

std::string encode_hex(const cbor::Encoder& encoder, const Value& v) {
  auto [err, bytes] = encoder.marshal(v);
  if (err) {
    return "error: " + err.message();
  }
  return cbor::utils::to_hex(bytes);
}

std::string encode_hex(const Value& v) {
  return encode_hex(cbor::Encoder{}, v);
}

Value u(std::uint64_t v) {
  return Value::uinteger(v);
}

Value t(const char* s) {
  return Value::text(s);
}

void test_arrays() {
  TEST_EXPECT_EQ(encode_hex(Value::array({})), "80");
  TEST_EXPECT_EQ(encode_hex(Value::array({u(1), u(2), u(3)})), "83010203");
  TEST_EXPECT_EQ(encode_hex(Value::array({u(1), Value::array({u(2), u(3)}), Value::array({u(4), u(5)})})),
                 "8301820203820405");

  std::vector<Value> items;
  for (std::uint64_t i = 1; i <= 25; ++i) {
    items.push_back(u(i));
  }
  TEST_EXPECT_EQ(encode_hex(Value::array(items)), "98190102030405060708090a0b0c0d0e0f101112131415161718181819");

  std::vector<Value> many(1000, Value::null());
  TEST_EXPECT_EQ(encode_hex(Value::array(many)).substr(0, 6), "9903e8");
}

void test_maps() {
  TEST_EXPECT_EQ(encode_hex(Value::map({})), "a0");
  TEST_EXPECT_EQ(encode_hex(Value::map({{u(1), u(2)}, {u(3), u(4)}})), "a201020304");
  TEST_EXPECT_EQ(encode_hex(Value::map({{t("a"), u(1)}, {t("b"), Value::array({u(2), u(3)})}})),
                 "a26161016162820203");
  TEST_EXPECT_EQ(encode_hex(Value::array({t("a"), Value::map({{t("b"), t("c")}})})), "826161a161626163");
  TEST_EXPECT_EQ(
    encode_hex(Value::map(
      {{t("a"), t("A")}, {t("b"), t("B")}, {t("c"), t("C")}, {t("d"), t("D")}, {t("e"), t("E")}})),
    "a56161614161626142616361436164614461656145");

  // 容器可作为 key。
  TEST_EXPECT_EQ(encode_hex(Value::map({{Value::array({u(1)}), u(2)}})), "a1810102");
}

void test_map_order_is_insertion_independent() {
  cbor::Map entries;
  for (std::uint64_t i = 0; i < 40; ++i) {
    entries.emplace_back(Value::text("k" + std::to_string(i)), u(i));
    entries.emplace_back(Value::integer(-static_cast<std::int64_t>(i) - 1), Value::boolean(i % 2 == 0));
  }
  const auto expected = encode_hex(Value::map(entries));

  std::mt19937 rng(12345);
  for (int round = 0; round < 10; ++round) {
    std::shuffle(entries.begin(), entries.end(), rng);
    TEST_EXPECT_EQ(encode_hex(Value::map(entries)), expected);
  }
}

void test_mixed_key_types_sort_by_encoded_bytes() {
  // 编码后的 key：01 < 6161 < f5 < f6
  auto m = Value::map({{t("a"), u(1)}, {Value::null(), u(4)}, {u(1), u(2)}, {Value::boolean(true), u(3)}});
  TEST_EXPECT_EQ(encode_hex(m), "a40102616101f503f604");
}

void test_key_order_modes() {
  // 24 编码为 1818（2 字节），-1 编码为 20（1 字节）。
  auto m = Value::map({{Value::integer(-1), u(0)}, {u(24), u(0)}});

  cbor::Encoder bytewise;
  TEST_EXPECT_EQ(encode_hex(bytewise, m), "a21818002000");

  cbor::EncodeOptions opt;
  opt.keys = cbor::key_order::length_first;
  cbor::Encoder length_first(cbor::default_field_cache(), opt);
  TEST_EXPECT_EQ(encode_hex(length_first, m), "a22000181800");

  // 等长 key 在两种模式下顺序一致。
  auto same_len = Value::map({{t("b"), u(2)}, {t("a"), u(1)}});
  TEST_EXPECT_EQ(encode_hex(bytewise, same_len), encode_hex(length_first, same_len));
}

void test_duplicate_keys_are_rejected() {
  auto dup = Value::map({{t("a"), u(1)}, {t("a"), u(2)}});
  auto [err, bytes] = cbor::marshal(dup);
  TEST_EXPECT(err.code() == cbor::errc::unsupported_value);
  TEST_EXPECT_EQ(err.message(), "cbor: unsupported value: duplicate map key");
  TEST_EXPECT(bytes.empty());

  // 不同的源 key 编码结果相同也算重复。
  auto same_encoding = Value::map({{Value::integer(7), u(1)}, {u(7), u(2)}});
  TEST_EXPECT(cbor::marshal(same_encoding).first.code() == cbor::errc::unsupported_value);
}

void test_errors_inside_keys_and_values_propagate() {
  auto bad_key = Value::map({{Value::float64(std::numeric_limits<double>::quiet_NaN()), u(1)}});
  TEST_EXPECT(cbor::marshal(bad_key).first.code() == cbor::errc::unsupported_value);

  auto bad_value = Value::map({{t("a"), Value::array({Value::text("\xfe")})}});
  TEST_EXPECT(cbor::marshal(bad_value).first.code() == cbor::errc::invalid_text);

  auto opaque = Value::array({u(1), Value::opaque("std::function<void ()>")});
  auto [err, bytes] = cbor::marshal(opaque);
  TEST_EXPECT(err.code() == cbor::errc::unsupported_type);
  TEST_EXPECT_EQ(err.message(), "cbor: unsupported type: std::function<void ()>");
  TEST_EXPECT(bytes.empty());
}

void test_depth_limit() {
  cbor::EncodeOptions opt;
  opt.max_depth = 2;
  cbor::Encoder shallow(cbor::default_field_cache(), opt);

  TEST_EXPECT_EQ(encode_hex(shallow, Value::array({Value::array({u(1)})})), "818101");

  auto [err, bytes] = shallow.marshal(Value::array({Value::array({Value::array({u(1)})})}));
  TEST_EXPECT(err.code() == cbor::errc::unsupported_value);
  TEST_EXPECT_EQ(err.message(), "cbor: unsupported value: nesting depth exceeds 2");

  Value deep = Value::null();
  for (int i = 0; i < 600; ++i) {
    deep = Value::array({std::move(deep)});
  }
  TEST_EXPECT(cbor::marshal(deep).first.code() == cbor::errc::unsupported_value);
}

void test_host_containers() {
  std::map<std::string, int> ordered{{"b", 2}, {"a", 1}};
  TEST_EXPECT_EQ(cbor::utils::to_hex(cbor::marshal(ordered).second), "a2616101616202");

  std::unordered_map<std::string, int> unordered;
  std::map<std::string, int> reference;
  for (int i = 0; i < 64; ++i) {
    unordered.emplace("key" + std::to_string(i), i);
    reference.emplace("key" + std::to_string(i), i);
  }
  TEST_EXPECT_EQ(cbor::marshal(unordered).second, cbor::marshal(reference).second);

  const std::vector<std::uint8_t> raw{0x01, 0x02};
  TEST_EXPECT_EQ(cbor::utils::to_hex(cbor::marshal(raw).second), "420102");

  const std::vector<int> ints{1, -1};
  TEST_EXPECT_EQ(cbor::utils::to_hex(cbor::marshal(ints).second), "820120");

  const std::vector<bool> flags{true, false};
  TEST_EXPECT_EQ(cbor::utils::to_hex(cbor::marshal(flags).second), "82f5f4");

  const std::optional<int> none;
  TEST_EXPECT_EQ(cbor::utils::to_hex(cbor::marshal(none).second), "f6");

  const std::vector<std::optional<std::string>> maybe{std::string("x"), std::nullopt};
  TEST_EXPECT_EQ(cbor::utils::to_hex(cbor::marshal(maybe).second), "826178f6");
}

}  // namespace

int main() {
  test_arrays();
  test_maps();
  test_map_order_is_insertion_independent();
  test_mixed_key_types_sort_by_encoded_bytes();
  test_key_order_modes();
  test_duplicate_keys_are_rejected();
  test_errors_inside_keys_and_values_propagate();
  test_depth_limit();
  test_host_containers();
  return ::cbor::tests::run_and_report();
}
