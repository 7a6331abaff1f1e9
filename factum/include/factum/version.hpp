#pragma once

#define FACTUM_VERSION "1.3.0"
#define FACTUM_SCHEMA_VERSION 1

namespace factum {
namespace version {

// Stores written by a different schema version are not opened
inline bool schema_compatible(int schema) {
    return schema == FACTUM_SCHEMA_VERSION;
}

} // namespace version
} // namespace factum
