// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroUuid/Core/UuidError.h>

namespace MicroUuid {

const char *serializeUuidError(UuidError error) {
    const char *errorCstr = "";
    switch (error) {
        case UuidError::None:
            errorCstr = "None";
            break;
        case UuidError::InvalidLength:
            errorCstr = "InvalidLength";
            break;
        case UuidError::InvalidFormat:
            errorCstr = "InvalidFormat";
            break;
        case UuidError::InvalidHexDigit:
            errorCstr = "InvalidHexDigit";
            break;
        case UuidError::EntropySourceUnavailable:
            errorCstr = "EntropySourceUnavailable";
            break;
        case UuidError::DigestUnavailable:
            errorCstr = "DigestUnavailable";
            break;
    }
    return errorCstr;
}

} //namespace MicroUuid
