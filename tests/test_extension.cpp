#include "cbor/cbor.hpp"
#include "cbor/utils/hex.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace {

// 十进制小数（tag 4）：[-2, cents]
struct Money final : cbor::Marshaler {
  explicit Money(std::uint64_t c = 0) : cents(c) {}

  std::error_code marshal_cbor(std::vector<cbor::byte>& out) const override {
    cbor::ItemWriter w(out);
    w.write_head(cbor::major_type::tag, 4);
    w.write_head(cbor::major_type::array, 2);
    w.write_head(cbor::major_type::negative_integer, 1);
    w.write_head(cbor::major_type::unsigned_integer, cents);
    return {};
  }

  std::uint64_t cents;
};

struct Broken final : cbor::Marshaler {
  std::error_code marshal_cbor(std::vector<cbor::byte>& out) const override {
    out.push_back(0x01);
    return std::make_error_code(std::errc::invalid_argument);
  }
};

// 钩子输出不做校验：即使不是合法 CBOR 也原样追加。
struct Raw final : cbor::Marshaler {
  std::error_code marshal_cbor(std::vector<cbor::byte>& out) const override {
    out.push_back(0xff);
    out.push_back(0xff);
    return {};
  }
};

struct Invoice {
  Money total;
  std::shared_ptr<Money> tip;
};

}  // namespace

template <>
struct cbor::record_traits<Invoice> {
  static constexpr auto fields =
    std::make_tuple(cbor::field("Total", &Invoice::total), cbor::field("Tip", &Invoice::tip, "Tip,omitempty"));
};

namespace {

template <class T>
std::string encode_hex(const T& v) {
  auto [err, bytes] = cbor::marshal(v);
  if (err) {
    return "error: " + err.message();
  }
  return cbor::utils::to_hex(bytes);
}

void test_hook_output_is_spliced() {
  TEST_EXPECT_EQ(encode_hex(Money{12345}), "c48221193039");
  TEST_EXPECT_EQ(encode_hex(Raw{}), "ffff");

  auto arr = cbor::Value::array({cbor::to_value(Money{12345}), cbor::Value::uinteger(1)});
  TEST_EXPECT_EQ(encode_hex(arr), "82c4822119303901");

  auto keyed = cbor::Value::map({{cbor::to_value(Money{1}), cbor::Value::boolean(true)}});
  TEST_EXPECT_EQ(encode_hex(keyed), "a1c4822101f5");
}

void test_hook_inside_record() {
  Invoice invoice{Money{5}, nullptr};
  TEST_EXPECT_EQ(encode_hex(invoice), "a165546f74616cc4822105");

  invoice.tip = std::make_shared<Money>(1);
  // "Tip" (63...) 排在 "Total" (65...) 之前
  TEST_EXPECT_EQ(encode_hex(invoice), "a263546970c482210165546f74616cc4822105");
}

void test_null_marshaler_encodes_null() {
  TEST_EXPECT_EQ(encode_hex(cbor::Value::extension(nullptr)), "f6");

  std::shared_ptr<Money> none;
  TEST_EXPECT_EQ(encode_hex(none), "f6");
  TEST_EXPECT(cbor::is_empty(cbor::Value::extension(nullptr)));
  TEST_EXPECT(!cbor::is_empty(cbor::to_value(Money{})));
}

void test_hook_failure_is_wrapped() {
  auto value = cbor::Value::array({cbor::Value::uinteger(1), cbor::to_value(Broken{})});
  auto [err, bytes] = cbor::marshal(value);

  TEST_EXPECT(err.code() == cbor::errc::extension_failed);
  TEST_EXPECT(err.cause() == std::errc::invalid_argument);
  TEST_EXPECT(err.subject().find("Broken") != std::string::npos);
  TEST_EXPECT_EQ(err.message().rfind("cbor: error calling marshal_cbor for type ", 0), std::size_t{0});
  TEST_EXPECT(err.message().find(std::make_error_code(std::errc::invalid_argument).message()) != std::string::npos);
  TEST_EXPECT(bytes.empty());

  // 追加模式下失败的钩子不会留下任何字节。
  std::vector<cbor::byte> out{0x80};
  cbor::Encoder encoder;
  TEST_EXPECT(static_cast<bool>(encoder.encode(cbor::to_value(Broken{}), out)));
  TEST_EXPECT_EQ(out.size(), std::size_t{1});
}

}  // namespace

int main() {
  test_hook_output_is_spliced();
  test_hook_inside_record();
  test_null_marshaler_encodes_null();
  test_hook_failure_is_wrapped();
  return ::cbor::tests::run_and_report();
}
