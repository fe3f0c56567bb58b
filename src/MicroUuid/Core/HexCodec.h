// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_HEXCODEC_H
#define MU_HEXCODEC_H

#include <stdint.h>
#include <stddef.h>

#include <MicroUuid/Core/UuidError.h>

namespace MicroUuid {

enum class HexCase : uint8_t {
    Lower, //0-9a-f
    Upper  //0-9A-F
};

/*
 * Writes exactly two hex characters for `byte` into `dst`. No terminating null
 */
void encodeHexByte(unsigned char byte, char *dst, HexCase hexCase = HexCase::Lower);

/*
 * Decodes the two hex characters at `src[pos]` and `src[pos + 1]`. Upper and lower case are accepted.
 * On failure, returns InvalidHexDigit with the absolute index of the offending character
 */
UuidStatus decodeHexByte(const char *src, size_t pos, unsigned char& out);

} //namespace MicroUuid
#endif
