#include "cbor/core/common.hpp"

#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace cbor::core {

std::string demangle(const char *mangled) {
    if (mangled == nullptr) {
        return {};
    }
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> readable(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && readable) {
        return readable.get();
    }
#endif
    return mangled;
}

} // namespace cbor::core
