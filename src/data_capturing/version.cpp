#include "data_capturing/version.hpp"

#ifndef DATA_CAPTURING_VERSION_STRING
#error "DATA_CAPTURING_VERSION_STRING must be provided by the build"
#endif

#ifndef DATA_CAPTURING_VERSION_NUMBER
#error "DATA_CAPTURING_VERSION_NUMBER must be provided by the build"
#endif

namespace data_capturing {

const double k_version_number = DATA_CAPTURING_VERSION_NUMBER;
const char k_version_string[] = DATA_CAPTURING_VERSION_STRING;

namespace {
constexpr std::string_view k_library_name{"DataCapturing"};
}  // namespace

double version_number() noexcept {
    return k_version_number;
}

std::string_view version_string() noexcept {
    return std::string_view{k_version_string};
}

std::string library_identity() {
    std::string identity{k_library_name};
    identity += ' ';
    identity += version_string();
    return identity;
}

}  // namespace data_capturing
