#include <recomp/util/string_utils.h>

#include <cstdlib>
#include <cxxabi.h>
#include <memory>

namespace recomp {
    std::string type_name(const std::type_info &type) {
        int status{0};
        std::unique_ptr<char, void (*)(void *)> demangled{
            abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), std::free
        };
        if (status != 0 || demangled == nullptr) { return type.name(); }
        return demangled.get();
    }

    std::string short_type_name(const std::type_info &type) {
        auto full = type_name(type);

        std::string result;
        result.reserve(full.size());
        int depth{0};
        for (char c: full) {
            if (c == '<') {
                ++depth;
            } else if (c == '>') {
                --depth;
            } else if (depth == 0) {
                result += c;
            }
        }

        if (auto pos = result.rfind("::"); pos != std::string::npos) { result = result.substr(pos + 2); }
        return result;
    }
} // namespace recomp
