#pragma once

// Build/version info.
//
// CMake defines DRAGONSLAYER_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef DRAGONSLAYER_VERSION
#define DRAGONSLAYER_VERSION "dev"
#endif

#ifndef DRAGONSLAYER_APPNAME
#define DRAGONSLAYER_APPNAME "Dragonslayer"
#endif
