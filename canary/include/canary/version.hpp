#pragma once

#define CANARY_VERSION "0.4.0"
#define CANARY_LEDGER_FORMAT_MAJOR 1
#define CANARY_LEDGER_FORMAT_MINOR 0

namespace canary {
namespace version {

inline bool ledger_compatible(int major, int minor) {
    // Major version must match exactly (breaking changes)
    // Minor version: reader must be >= writer (backward compatible additions)
    return major == CANARY_LEDGER_FORMAT_MAJOR &&
           minor <= CANARY_LEDGER_FORMAT_MINOR;
}

} // namespace version
} // namespace canary
