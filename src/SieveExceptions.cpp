#include "SieveExceptions.h"

namespace Sieve {

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::IO: return "io";
        case ErrorKind::DATASET: return "dataset";
        case ErrorKind::CONFIGURATION: return "configuration";
        case ErrorKind::DATA_CONTRACT: return "data_contract";
        case ErrorKind::RESOLUTION: return "resolution";
        case ErrorKind::GENERIC: break;
    }
    return "generic";
}

} // namespace Sieve
