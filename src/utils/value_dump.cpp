#include "cbor/utils/value_dump.hpp"

#include "cbor/field_cache.hpp"
#include "cbor/utils/hex.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <typeinfo>

namespace cbor::utils {
namespace {

struct DumpContext final {
    std::ostringstream oss;
    ValueDumpOptions options{};
};

void append_escaped_text_(std::ostringstream &oss,
                          const std::string &s,
                          std::size_t max_bytes) {
    const std::size_t total = s.size();
    std::size_t n = (max_bytes == 0 ? total : std::min(total, max_bytes));
    // 截断点回退到码点边界，不切开多字节序列。
    while (n > 0 && n < total &&
           (static_cast<unsigned char>(s[n]) & 0xC0u) == 0x80u) {
        --n;
    }

    oss << '"';
    for (std::size_t i = 0; i < n; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c == '\\') {
            oss << "\\\\";
            continue;
        }
        if (c == '"') {
            oss << "\\\"";
            continue;
        }
        // UTF-8 多字节序列原样输出，仅转义控制字符。
        if (c >= 0x20 && c != 0x7F) {
            oss << static_cast<char>(c);
            continue;
        }
        oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(c) << std::dec;
    }
    if (max_bytes != 0 && total > max_bytes) {
        oss << "...";
    }
    oss << '"';
}

void append_bytes_(std::ostringstream &oss,
                   const std::vector<cbor::byte> &bytes,
                   std::size_t max_bytes) {
    const std::size_t total = bytes.size();
    const std::size_t n = (max_bytes == 0 ? total : std::min(total, max_bytes));
    oss << "h'" << to_hex(cbor::bytes_view{bytes.data(), n});
    if (max_bytes != 0 && total > max_bytes) {
        oss << "...";
    }
    oss << '\'';
}

template <class Float>
void append_float_(std::ostringstream &oss, Float f) {
    if (std::isnan(f)) {
        oss << "NaN";
        return;
    }
    if (std::isinf(f)) {
        oss << (f < 0 ? "-Infinity" : "Infinity");
        return;
    }
    // 最短可往返表示；整数值补 ".0" 以区别于整数。
    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), f);
    const std::string_view text(buf, static_cast<std::size_t>(res.ptr - buf));
    oss << text;
    if (text.find_first_of(".e") == std::string_view::npos) {
        oss << ".0";
    }
}

void append_value_(DumpContext &ctx, const cbor::Value &value, std::size_t depth);

template <class Range, class Fn>
void append_items_(DumpContext &ctx,
                   const Range &items,
                   char open,
                   char close,
                   std::size_t depth,
                   Fn &&append_one) {
    const auto &opt = ctx.options;
    const std::size_t total = items.size();
    const std::size_t n =
        (opt.max_items == 0 ? total : std::min(total, opt.max_items));

    ctx.oss << open;
    if (total != 0 && depth >= opt.max_depth) {
        ctx.oss << "..." << close;
        return;
    }
    for (std::size_t i = 0; i < n; ++i) {
        if (i != 0) {
            ctx.oss << ", ";
        }
        append_one(items[i]);
    }
    if (opt.max_items != 0 && total > opt.max_items) {
        ctx.oss << ", ...";
    }
    ctx.oss << close;
}

void append_record_(DumpContext &ctx, const cbor::Record &record, std::size_t depth) {
    if (ctx.options.show_record_type) {
        ctx.oss << record.type_name();
    }
    const auto declared = record.declared_fields();
    const auto fields = cbor::extract_fields(declared);
    append_items_(ctx, fields, '{', '}', depth, [&](const cbor::FieldDescriptor &f) {
        append_escaped_text_(ctx.oss, f.name, ctx.options.max_payload_bytes);
        ctx.oss << ": ";
        append_value_(ctx, record.field(f.slot), depth + 1);
    });
}

void append_value_(DumpContext &ctx, const cbor::Value &value, std::size_t depth) {
    const auto &opt = ctx.options;

    std::visit(
        [&](const auto &v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, cbor::Null>) {
                ctx.oss << "null";
            } else if constexpr (std::is_same_v<T, cbor::Undefined>) {
                ctx.oss << "undefined";
            } else if constexpr (std::is_same_v<T, cbor::Bool>) {
                ctx.oss << (v.value ? "true" : "false");
            } else if constexpr (std::is_same_v<T, cbor::Int> ||
                                 std::is_same_v<T, cbor::Uint>) {
                ctx.oss << v.value;
            } else if constexpr (std::is_same_v<T, cbor::F32> ||
                                 std::is_same_v<T, cbor::F64>) {
                append_float_(ctx.oss, v.value);
            } else if constexpr (std::is_same_v<T, cbor::Text>) {
                append_escaped_text_(ctx.oss, v.value, opt.max_payload_bytes);
            } else if constexpr (std::is_same_v<T, cbor::Bytes>) {
                append_bytes_(ctx.oss, v.value, opt.max_payload_bytes);
            } else if constexpr (std::is_same_v<T, cbor::Array>) {
                append_items_(ctx, v, '[', ']', depth, [&](const cbor::Value &child) {
                    append_value_(ctx, child, depth + 1);
                });
            } else if constexpr (std::is_same_v<T, cbor::Map>) {
                append_items_(ctx, v, '{', '}', depth, [&](const auto &entry) {
                    append_value_(ctx, entry.first, depth + 1);
                    ctx.oss << ": ";
                    append_value_(ctx, entry.second, depth + 1);
                });
            } else if constexpr (std::is_same_v<T, cbor::RecordRef>) {
                if (!v.record) {
                    ctx.oss << "null";
                } else {
                    append_record_(ctx, *v.record, depth);
                }
            } else if constexpr (std::is_same_v<T, cbor::Extension>) {
                if (!v.marshaler) {
                    ctx.oss << "null";
                } else {
                    ctx.oss << "<extension "
                            << cbor::core::demangle(typeid(*v.marshaler).name()) << '>';
                }
            } else {
                ctx.oss << "<unsupported " << v.type_name << '>';
            }
        },
        value.storage());
}

} // namespace

std::string dump_value(const cbor::Value &value, ValueDumpOptions options) {
    DumpContext ctx;
    ctx.options = options;

    append_value_(ctx, value, 0);
    return ctx.oss.str();
}

} // namespace cbor::utils
