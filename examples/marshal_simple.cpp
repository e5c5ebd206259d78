#include <cbor/cbor.hpp>
#include <cbor/utils/hex.hpp>
#include <cbor/utils/value_dump.hpp>

#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace cbor;

int main() {
    std::cout << "=== CBOR 规范编码简单示例 ===\n\n";

    // 手工构造 Value
    Value msg = Value::map({
        {Value::text("b"), Value::array({Value::uinteger(2), Value::uinteger(3)})},
        {Value::text("a"), Value::integer(-1)},
        {Value::text("pi"), Value::float64(3.25)},
    });
    std::cout << "值: " << utils::dump_value(msg) << "\n";

    auto [err, encoded] = marshal(msg);
    if (err) {
        std::cerr << "编码失败: " << err.message() << "\n";
        return 1;
    }
    std::cout << "编码成功: " << encoded.size() << " 字节\n";
    std::cout << "hex: " << utils::to_hex(encoded) << "\n\n";

    // 宿主容器直接编码（key 顺序与插入顺序无关）
    std::map<std::string, std::vector<int>> host{{"odd", {1, 3}}, {"even", {2, 4}}};
    auto host_result = marshal(host);
    if (host_result.first) {
        std::cerr << "编码失败: " << host_result.first.message() << "\n";
        return 1;
    }
    std::cout << "宿主 map: " << utils::to_hex(host_result.second) << "\n";

    // 非法 UTF-8 会被拒绝
    auto bad = marshal(std::string("\xff\xfe"));
    std::cout << "非法文本: " << bad.first.message() << "\n";

    return 0;
}
