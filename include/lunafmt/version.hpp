/*
 * Fallback version header for lunafmt
 *
 * The build system passes LUNAFMT_VERSION_* as compile definitions taken from
 * the CMake project version. These defaults only apply when a translation unit
 * is compiled outside of that build.
 */

#pragma once

#ifndef LUNAFMT_VERSION_MAJOR
#define LUNAFMT_VERSION_MAJOR 0
#endif

#ifndef LUNAFMT_VERSION_MINOR
#define LUNAFMT_VERSION_MINOR 0
#endif

#ifndef LUNAFMT_VERSION_PATCH
#define LUNAFMT_VERSION_PATCH 0
#endif

#ifndef LUNAFMT_VERSION_STRING
#define LUNAFMT_VERSION_STRING "0.0.0+dev"
#endif

#if defined(__cplusplus)
namespace lunafmt {
namespace version {
constexpr int major_v = LUNAFMT_VERSION_MAJOR;
constexpr int minor_v = LUNAFMT_VERSION_MINOR;
constexpr int patch_v = LUNAFMT_VERSION_PATCH;
constexpr const char* string_v = LUNAFMT_VERSION_STRING;
} // namespace version
} // namespace lunafmt
#endif
