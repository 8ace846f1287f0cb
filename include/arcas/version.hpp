#pragma once

/**
 * @file version.hpp
 * @brief arcas version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace arcas {

/// arcas version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// On-disk format versions
constexpr const char* kStoreLayoutVersion = "cas.v1";
constexpr const char* kAuthoritySchemaVersion = "authority.v1";

}  // namespace arcas
