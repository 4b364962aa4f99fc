#pragma once

// Build/version info.
//
// CMake defines GRIDROGUE_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef GRIDROGUE_VERSION
#define GRIDROGUE_VERSION "dev"
#endif

#ifndef GRIDROGUE_APPNAME
#define GRIDROGUE_APPNAME "GridRogue"
#endif
