/**
 * @file record_example.cpp
 * @brief 演示记录类型的字段声明、重命名、omitempty 与自定义编码钩子
 *
 * 运行：
 * - ./build/examples/record_example [--declaration-order] [--debug]
 */

#include <cbor/cbor.hpp>
#include <cbor/core/log.hpp>
#include <cbor/utils/hex.hpp>
#include <cbor/utils/value_dump.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

// 以 RFC 3339 文本（tag 0）输出的时间戳。
struct Timestamp final : cbor::Marshaler {
    explicit Timestamp(std::string t = {}) : text(std::move(t)) {}

    std::error_code marshal_cbor(std::vector<cbor::byte> &out) const override {
        if (text.empty()) {
            return std::make_error_code(std::errc::invalid_argument);
        }
        cbor::ItemWriter w(out);
        w.write_head(cbor::major_type::tag, 0);
        w.write_head(cbor::major_type::text_string, text.size());
        w.write_bytes(cbor::bytes_view{
            reinterpret_cast<const cbor::byte *>(text.data()), text.size()});
        return {};
    }

    std::string text;
};

struct Address {
    std::string city;
    std::string street;
};

struct Employee {
    std::string name;
    std::uint32_t id{0};
    std::optional<Address> address;
    std::vector<std::string> roles;
    std::string password;
    Timestamp hired;
};

} // namespace

template <>
struct cbor::record_traits<Address> {
    static constexpr auto fields = std::make_tuple(
        cbor::field("City", &Address::city, "city"),
        cbor::field("Street", &Address::street, "street,omitempty"));
};

template <>
struct cbor::record_traits<Employee> {
    static constexpr auto fields = std::make_tuple(
        cbor::field("Name", &Employee::name, "name"),
        cbor::field("ID", &Employee::id, "id"),
        cbor::field("Address", &Employee::address, "address,omitempty"),
        cbor::field("Roles", &Employee::roles, "roles,omitempty"),
        cbor::hidden_field("password", &Employee::password),
        cbor::field("Hired", &Employee::hired, "hired"));
};

int main(int argc, char **argv) {
    cbor::EncodeOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--declaration-order") {
            options.record_keys = cbor::record_key_order::declaration;
        } else if (arg == "--debug") {
            cbor::core::set_log_level(cbor::core::LogLevel::debug);
        } else {
            std::cerr << "未知参数: " << arg << "\n";
            return 2;
        }
    }

    cbor::FieldCache cache;
    const cbor::Encoder encoder(cache, options);

    Employee alice;
    alice.name = "Alice";
    alice.id = 1001;
    alice.address = Address{"Berlin", ""};
    alice.roles = {"admin"};
    alice.password = "hunter2";
    alice.hired = Timestamp{"2020-01-02T03:04:05Z"};

    const auto value = cbor::to_value(alice);
    std::cout << "值: " << cbor::utils::dump_value(value) << "\n";

    auto [err, encoded] = encoder.marshal(value);
    if (err) {
        std::cerr << "编码失败: " << err.message() << "\n";
        return 1;
    }
    std::cout << "hex: " << cbor::utils::to_hex(encoded) << "\n";
    std::cout << "已缓存记录类型数: " << cache.size() << "\n\n";

    // 钩子失败时整个编码失败，错误中带类型名
    Employee bob;
    bob.name = "Bob";
    auto failed = cbor::marshal(encoder, bob);
    std::cout << "预期失败: " << failed.first.message() << "\n";

    return 0;
}
