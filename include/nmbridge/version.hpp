/*
 * Fallback version header for nmbridge
 *
 * The build system defines NMBRIDGE_VERSION_* on the command line from the
 * project() version. These defaults only apply when a translation unit is
 * compiled outside of that build.
 */

#pragma once

#ifndef NMBRIDGE_VERSION_MAJOR
#define NMBRIDGE_VERSION_MAJOR 0
#endif

#ifndef NMBRIDGE_VERSION_MINOR
#define NMBRIDGE_VERSION_MINOR 1
#endif

#ifndef NMBRIDGE_VERSION_PATCH
#define NMBRIDGE_VERSION_PATCH 0
#endif

#ifndef NMBRIDGE_VERSION_STRING
#define NMBRIDGE_VERSION_STRING "0.1.0"
#endif

// Identity reported to the companion and to MCP clients
#ifndef NMBRIDGE_HOST_NAME
#define NMBRIDGE_HOST_NAME "ai.algonius.mcp.host"
#endif

#if defined(__cplusplus)
namespace nmbridge {
namespace version {
constexpr int major_v = NMBRIDGE_VERSION_MAJOR;
constexpr int minor_v = NMBRIDGE_VERSION_MINOR;
constexpr int patch_v = NMBRIDGE_VERSION_PATCH;
constexpr const char* string_v = NMBRIDGE_VERSION_STRING;
constexpr const char* host_name_v = NMBRIDGE_HOST_NAME;
} // namespace version
} // namespace nmbridge
#endif
