/*
 * Version macros for modelfetch
 *
 * The build system defines MODELFETCH_VERSION_* from project(VERSION ...); the
 * defaults below only apply when a translation unit is compiled outside of it.
 */

#pragma once

#ifndef MODELFETCH_VERSION_MAJOR
#define MODELFETCH_VERSION_MAJOR 0
#endif

#ifndef MODELFETCH_VERSION_MINOR
#define MODELFETCH_VERSION_MINOR 0
#endif

#ifndef MODELFETCH_VERSION_PATCH
#define MODELFETCH_VERSION_PATCH 0
#endif

#ifndef MODELFETCH_VERSION_STRING
#define MODELFETCH_VERSION_STRING "0.0.0+dev"
#endif

#ifndef MODELFETCH_BUILD_DATE
#define MODELFETCH_BUILD_DATE __DATE__ " " __TIME__
#endif

#define MODELFETCH_VERSION_LONG_STRING MODELFETCH_VERSION_STRING " (built: " MODELFETCH_BUILD_DATE ")"

namespace modelfetch::version {
constexpr int major_v = MODELFETCH_VERSION_MAJOR;
constexpr int minor_v = MODELFETCH_VERSION_MINOR;
constexpr int patch_v = MODELFETCH_VERSION_PATCH;
constexpr const char* string_v = MODELFETCH_VERSION_STRING;
constexpr const char* long_string_v = MODELFETCH_VERSION_LONG_STRING;
} // namespace modelfetch::version
