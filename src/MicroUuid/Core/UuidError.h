// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_UUIDERROR_H
#define MU_UUIDERROR_H

#include <stdint.h>
#include <stddef.h>

namespace MicroUuid {

enum class UuidError : uint8_t {
    None,
    InvalidLength,            //input is not exactly 36 characters (or 16 bytes)
    InvalidFormat,            //a hyphen is missing or misplaced
    InvalidHexDigit,          //a character outside [0-9a-fA-F]
    EntropySourceUnavailable, //the secure entropy source failed
    DigestUnavailable         //the digest backend failed or isn't compiled in
};

const char *serializeUuidError(UuidError error);

/*
 * Result of a fallible UUID operation. Depending on the error, `position` and `character` locate
 * the failure in the input:
 *
 * InvalidLength:   `position` is the length of the input
 * InvalidFormat:   `position` is the index where the separator was expected
 * InvalidHexDigit: `position` is the absolute index of `character`
 */
struct UuidStatus {
    UuidError error = UuidError::None;
    size_t position = 0;
    char character = '\0';

    UuidStatus() = default;
    UuidStatus(UuidError error, size_t position = 0, char character = '\0') :
            error(error), position(position), character(character) { }

    bool ok() const {return error == UuidError::None;}
    operator bool() const {return ok();}
};

} //namespace MicroUuid
#endif
