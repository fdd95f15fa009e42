#pragma once

// Build/version info.
//
// CMake defines HEIST_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef HEIST_VERSION
#define HEIST_VERSION "dev"
#endif

#ifndef HEIST_APPNAME
#define HEIST_APPNAME "TerminalHeist"
#endif
