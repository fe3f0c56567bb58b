// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroUuid/Core/HexCodec.h>

namespace MicroUuid {

namespace {

const char hexDigitsLower [] = "0123456789abcdef";
const char hexDigitsUpper [] = "0123456789ABCDEF";

//returns the nibble value or -1 if `c` is no hex digit
int decodeNibble(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    } else if (c >= 'a' && c <= 'f') {
        return (c - 'a') + 0xA;
    } else if (c >= 'A' && c <= 'F') {
        return (c - 'A') + 0xA;
    }
    return -1;
}

} //namespace

void encodeHexByte(unsigned char byte, char *dst, HexCase hexCase) {
    const char *digits = hexCase == HexCase::Upper ? hexDigitsUpper : hexDigitsLower;
    dst[0] = digits[(byte >> 4) & 0x0F];
    dst[1] = digits[byte & 0x0F];
}

UuidStatus decodeHexByte(const char *src, size_t pos, unsigned char& out) {
    int hi = decodeNibble(src[pos]);
    if (hi < 0) {
        return UuidStatus(UuidError::InvalidHexDigit, pos, src[pos]);
    }

    int lo = decodeNibble(src[pos + 1]);
    if (lo < 0) {
        return UuidStatus(UuidError::InvalidHexDigit, pos + 1, src[pos + 1]);
    }

    out = (unsigned char)((hi << 4) | lo);
    return UuidStatus();
}

} //namespace MicroUuid
