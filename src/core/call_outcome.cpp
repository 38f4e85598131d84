#include "circuitry/core/call_outcome.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <typeinfo>

namespace circuitry {

namespace {

std::string demangle(const char* mangled) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> readable(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status),
        std::free
    );
    if (status != 0 || !readable) {
        return mangled;
    }
    return readable.get();
}

}  // namespace

ErrorInfo ErrorInfo::from_exception(std::exception_ptr error) {
    if (!error) {
        return {"unknown", "no exception", nullptr};
    }

    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return {demangle(typeid(e).name()), e.what(), error};
    } catch (...) {
        // Not derived from std::exception; the pointer itself is kept so
        // classifiers can still match on the exact type.
        const std::type_info* thrown = abi::__cxa_current_exception_type();
        return {thrown ? demangle(thrown->name()) : std::string("unknown"), "non-standard exception", error};
    }
}

}  // namespace circuitry
