#pragma once

// Package identity reported in the User-Agent header. The build defines both
// from the CMake project; the fallbacks only matter for out-of-tree builds.

#ifndef VAULTPP_PACKAGE_NAME
#define VAULTPP_PACKAGE_NAME "vaultpp-secrets"
#endif

#ifndef VAULTPP_PACKAGE_VERSION
#define VAULTPP_PACKAGE_VERSION "0.0.0"
#endif

namespace vaultpp {

inline constexpr const char* kPackageName = VAULTPP_PACKAGE_NAME;
inline constexpr const char* kPackageVersion = VAULTPP_PACKAGE_VERSION;

}  // namespace vaultpp
