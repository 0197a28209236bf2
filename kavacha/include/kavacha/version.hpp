#pragma once

#define KAVACHA_VERSION "1.4.0"
#define KAVACHA_VERSION_MAJOR 1
#define KAVACHA_VERSION_MINOR 4

namespace kavacha {
namespace version {

inline bool config_compatible(int major, int minor) {
    // Major version must match exactly (breaking config changes)
    // Minor version: library must be >= config writer (additive fields only)
    return major == KAVACHA_VERSION_MAJOR &&
           minor <= KAVACHA_VERSION_MINOR;
}

} // namespace version
} // namespace kavacha
