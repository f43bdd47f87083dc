#pragma once

#define PSYCHE_VERSION "1.0.0"
#define PSYCHE_ARCHIVE_SCHEMA_VERSION 2

namespace psyche {
namespace version {

// Archives are readable only by the schema that wrote them
inline bool archive_compatible(int schema) {
    return schema == PSYCHE_ARCHIVE_SCHEMA_VERSION;
}

} // namespace version
} // namespace psyche
