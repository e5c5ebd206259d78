#include "bench_main.hpp"
#include "cbor/cbor.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

using namespace cbor;

namespace {

struct Sample {
  std::string name;
  std::int64_t id{0};
  double score{0.0};
  std::vector<std::string> tags;
  std::string note;
};

}  // namespace

template <>
struct cbor::record_traits<Sample> {
  static constexpr auto fields = std::make_tuple(
    cbor::field("Name", &Sample::name),
    cbor::field("ID", &Sample::id, "id"),
    cbor::field("Score", &Sample::score),
    cbor::field("Tags", &Sample::tags, ",omitempty"),
    cbor::field("Note", &Sample::note, "note,omitempty"));
};

static Value create_deep_nested_array(int depth) {
  // 创建深度嵌套的 Array
  if (depth <= 0) {
    return Value::uinteger(42);
  }
  return Value::array({create_deep_nested_array(depth - 1)});
}

static void bench_encode_deep_nested() {
  constexpr int depth = 256;

  Value value = create_deep_nested_array(depth);
  Encoder encoder;
  std::vector<byte> encoded;

  BENCH_RUN("CBOR: Deep nested array (256 levels)", depth, 3, {
    encoded.clear();
    auto err = encoder.encode(value, encoded);
    if (err) {
      std::cerr << "Encode failed: " << err.message() << "\n";
    }
  });
}

static void bench_encode_large_array() {
  constexpr std::size_t item_count = 100000;

  std::vector<Value> items;
  items.reserve(item_count);
  for (std::size_t i = 0; i < item_count; ++i) {
    items.push_back(i % 2 == 0 ? Value::uinteger(i) : Value::float64(static_cast<double>(i) + 0.1));
  }
  Value value = Value::array(std::move(items));

  Encoder encoder;
  std::vector<byte> encoded;
  if (auto err = encoder.encode(value, encoded)) {
    std::cerr << "Encode failed: " << err.message() << "\n";
    return;
  }
  const std::size_t encoded_bytes = encoded.size();

  BENCH_RUN("CBOR: Large array encode (100000 numbers)", encoded_bytes, 5, {
    encoded.clear();
    auto err = encoder.encode(value, encoded);
    if (err) {
      std::cerr << "Encode failed: " << err.message() << "\n";
    }
  });
}

static void bench_encode_map_sorting() {
  // map key 排序是规范编码的主要开销
  constexpr std::size_t entry_count = 10000;

  std::map<std::string, std::int64_t> host;
  for (std::size_t i = 0; i < entry_count; ++i) {
    host.emplace("key-" + std::to_string(entry_count - i), static_cast<std::int64_t>(i));
  }
  Value value = to_value(host);

  Encoder encoder;
  std::vector<byte> encoded;
  if (auto err = encoder.encode(value, encoded)) {
    std::cerr << "Encode failed: " << err.message() << "\n";
    return;
  }
  const std::size_t encoded_bytes = encoded.size();

  BENCH_RUN("CBOR: Map encode with key sort (10000 entries)", encoded_bytes, 5, {
    encoded.clear();
    auto err = encoder.encode(value, encoded);
    if (err) {
      std::cerr << "Map encode failed: " << err.message() << "\n";
    }
  });

  EncodeOptions opt;
  opt.keys = key_order::length_first;
  Encoder length_first(default_field_cache(), opt);

  BENCH_RUN("CBOR: Map encode length-first (10000 entries)", encoded_bytes, 5, {
    encoded.clear();
    auto err = length_first.encode(value, encoded);
    if (err) {
      std::cerr << "Map encode failed: " << err.message() << "\n";
    }
  });
}

static void bench_encode_records() {
  constexpr std::size_t record_count = 10000;

  std::vector<Sample> samples;
  samples.reserve(record_count);
  for (std::size_t i = 0; i < record_count; ++i) {
    samples.push_back(Sample{"sample-" + std::to_string(i),
                             static_cast<std::int64_t>(i),
                             static_cast<double>(i) / 4.0,
                             i % 3 == 0 ? std::vector<std::string>{"hot"} : std::vector<std::string>{},
                             ""});
  }
  Value value = to_value(samples);

  Encoder encoder;
  std::vector<byte> encoded;
  if (auto err = encoder.encode(value, encoded)) {
    std::cerr << "Encode failed: " << err.message() << "\n";
    return;
  }
  const std::size_t encoded_bytes = encoded.size();

  // 字段描述只在首次遇到类型时计算，之后命中缓存
  BENCH_RUN("CBOR: Record array encode (10000 records)", encoded_bytes, 5, {
    encoded.clear();
    auto err = encoder.encode(value, encoded);
    if (err) {
      std::cerr << "Record encode failed: " << err.message() << "\n";
    }
  });

  BENCH_RUN("CBOR: Host value conversion (10000 records)", encoded_bytes, 5, {
    auto result = marshal(samples);
    if (result.first) {
      std::cerr << "Marshal failed: " << result.first.message() << "\n";
    }
  });
}

static void bench_encode_text() {
  const std::string text(1024 * 1024, 'x');
  Value value = Value::text(text);

  Encoder encoder;
  std::vector<byte> encoded;

  // UTF-8 校验 + 拷贝
  BENCH_RUN("CBOR: Text encode (1 MB)", text.size(), 5, {
    encoded.clear();
    auto err = encoder.encode(value, encoded);
    if (err) {
      std::cerr << "Text encode failed: " << err.message() << "\n";
    }
  });
}

int main() {
  bench_encode_deep_nested();
  bench_encode_large_array();
  bench_encode_map_sorting();
  bench_encode_records();
  bench_encode_text();

  cbor::benchmarks::print_results();
  return 0;
}
