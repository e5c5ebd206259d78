#include "cbor/core/error.hpp"
#include "cbor/encoder.hpp"

#include "test_main.hpp"

#include <string_view>

namespace {

using cbor::core::errc;
using cbor::core::make_error_code;

void test_core_category_and_messages() {
  auto ec = make_error_code(errc::buffer_overflow);
  TEST_EXPECT(ec.category().name() != nullptr);
  TEST_EXPECT_EQ(std::string_view(ec.category().name()), "cbor.core");

  TEST_EXPECT_EQ(make_error_code(errc::ok).message(), "ok");
  TEST_EXPECT_EQ(make_error_code(errc::invalid_argument).message(), "invalid argument");
  TEST_EXPECT_EQ(make_error_code(errc::buffer_overflow).message(), "buffer overflow");

  std::error_code unknown(9999, cbor::core::error_category());
  TEST_EXPECT_EQ(unknown.message(), "unknown cbor.core error");
}

void test_encoder_category_and_messages() {
  auto ec = cbor::make_error_code(cbor::errc::unsupported_type);
  TEST_EXPECT_EQ(std::string_view(ec.category().name()), "cbor");
  TEST_EXPECT(ec.category() != cbor::core::error_category());

  TEST_EXPECT_EQ(cbor::make_error_code(cbor::errc::ok).message(), "ok");
  TEST_EXPECT_EQ(cbor::make_error_code(cbor::errc::unsupported_type).message(), "unsupported type");
  TEST_EXPECT_EQ(cbor::make_error_code(cbor::errc::unsupported_value).message(), "unsupported value");
  TEST_EXPECT_EQ(cbor::make_error_code(cbor::errc::invalid_text).message(), "invalid utf-8 text");
  TEST_EXPECT_EQ(cbor::make_error_code(cbor::errc::extension_failed).message(), "extension encoder failed");

  std::error_code unknown(9999, cbor::error_category());
  TEST_EXPECT_EQ(unknown.message(), "unknown cbor error");

  // is_error_code_enum 特化使 errc 可直接与 error_code 比较。
  std::error_code converted = cbor::errc::invalid_text;
  TEST_EXPECT(converted == cbor::errc::invalid_text);
}

void test_error_object_messages() {
  cbor::Error none;
  TEST_EXPECT(!none);
  TEST_EXPECT_EQ(none.message(), "ok");

  cbor::Error type_err(cbor::make_error_code(cbor::errc::unsupported_type), "std::complex<double>");
  TEST_EXPECT(static_cast<bool>(type_err));
  TEST_EXPECT_EQ(type_err.message(), "cbor: unsupported type: std::complex<double>");

  cbor::Error value_err(cbor::make_error_code(cbor::errc::unsupported_value), "NaN");
  TEST_EXPECT_EQ(value_err.message(), "cbor: unsupported value: NaN");

  cbor::Error text_err(cbor::make_error_code(cbor::errc::invalid_text), "abc");
  TEST_EXPECT_EQ(text_err.message(), "cbor: string is not valid UTF-8: abc");

  cbor::Error ext_err(cbor::make_error_code(cbor::errc::extension_failed),
                      "Money",
                      std::make_error_code(std::errc::invalid_argument));
  TEST_EXPECT_EQ(ext_err.cause(), std::make_error_code(std::errc::invalid_argument));
  TEST_EXPECT_EQ(ext_err.message(),
                 "cbor: error calling marshal_cbor for type Money: " +
                   std::make_error_code(std::errc::invalid_argument).message());

  cbor::Error overflow(make_error_code(errc::buffer_overflow), "need 3 bytes, have 1");
  TEST_EXPECT_EQ(overflow.message(), "cbor: buffer overflow: need 3 bytes, have 1");

  cbor::Error bare(make_error_code(errc::invalid_argument), "");
  TEST_EXPECT_EQ(bare.message(), "cbor: invalid argument");
}

}  // namespace

int main() {
  test_core_category_and_messages();
  test_encoder_category_and_messages();
  test_error_object_messages();
  return ::cbor::tests::run_and_report();
}
