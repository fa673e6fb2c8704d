#pragma once

#define PODIUM_VERSION "1.4.0"
#define PODIUM_SCHEMA_VERSION 2

namespace podium {
namespace version {

inline bool schema_compatible(int stored) {
    // Older databases are upgraded in place; newer ones are refused
    return stored >= 0 && stored <= PODIUM_SCHEMA_VERSION;
}

} // namespace version
} // namespace podium
