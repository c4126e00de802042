// === Version Metadata ========================================================
//
// Exposes the library identity: a numeric version identifier and the semantic
// version string. Both values are injected by the build from the CMake project
// version and stay constant for the lifetime of the process, so diagnostic
// tooling can query them without touching any other part of the library.

#pragma once

#include <string>
#include <string_view>

namespace data_capturing {

/**
 * @brief Numeric build identifier (`MAJOR.MINOR`, e.g. `1.0`).
 *
 * The minor version is read as decimal digits, so `1.1` and `1.10` map to the
 * same number and `1.9` compares greater than `1.10`. Use k_version_string
 * when versions have to be ordered or told apart exactly.
 */
extern const double k_version_number;

/** @brief Null-terminated semantic version string (e.g. `"1.0.0"`). */
extern const char k_version_string[];

/** @brief Return the numeric build identifier. */
[[nodiscard]] double version_number() noexcept;

/** @brief Return the semantic version string. */
[[nodiscard]] std::string_view version_string() noexcept;

/** @brief Human-readable banner combining library name and version. */
[[nodiscard]] std::string library_identity();

}  // namespace data_capturing
