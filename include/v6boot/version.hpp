/*
 * Fallback version header for v6boot
 *
 * The build system passes the version macros as compile definitions; these
 * defaults keep the code compiling when it does not.
 */

#pragma once

#ifndef V6BOOT_VERSION_MAJOR
#define V6BOOT_VERSION_MAJOR 0
#endif

#ifndef V6BOOT_VERSION_MINOR
#define V6BOOT_VERSION_MINOR 0
#endif

#ifndef V6BOOT_VERSION_PATCH
#define V6BOOT_VERSION_PATCH 0
#endif

#ifndef V6BOOT_VERSION_STRING
#define V6BOOT_VERSION_STRING "0.0.0+dev"
#endif

#ifndef V6BOOT_GIT_COMMIT
#define V6BOOT_GIT_COMMIT "unknown"
#endif

#ifndef V6BOOT_VERSION_LONG_STRING
#define V6BOOT_VERSION_LONG_STRING V6BOOT_VERSION_STRING " (commit: " V6BOOT_GIT_COMMIT ")"
#endif

#if defined(__cplusplus)
namespace v6boot {
namespace version {
constexpr int major_v = V6BOOT_VERSION_MAJOR;
constexpr int minor_v = V6BOOT_VERSION_MINOR;
constexpr int patch_v = V6BOOT_VERSION_PATCH;
constexpr const char* string_v = V6BOOT_VERSION_STRING;
constexpr const char* long_string_v = V6BOOT_VERSION_LONG_STRING;
} // namespace version
} // namespace v6boot
#endif
