// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroUuid/Core/TextFormat.h>
#include <MicroUuid/Core/UuidLayout.h>
#include <MicroUuid/Debug.h>

#define MU_UUID_SEP '-'

namespace MicroUuid {

namespace {

//index of the hyphen before each of the groups 2 - 5
const size_t sepIndex [] = {8, 13, 18, 23};

//number of hyphens written before the byte at index i
size_t sepCount(size_t i) {
    return (i >= 4) + (i >= 6) + (i >= 8) + (i >= 10);
}

} //namespace

void formatUuid(const unsigned char *bytes, char *dst, HexCase hexCase) {
    for (size_t i = 0; i < sizeof(sepIndex) / sizeof(sepIndex[0]); i++) {
        dst[sepIndex[i]] = MU_UUID_SEP;
    }

    for (size_t i = 0; i < MU_UUID_SIZE; i++) {
        encodeHexByte(bytes[i], dst + 2 * i + sepCount(i), hexCase);
    }
}

UuidStatus parseUuid(const char *text, size_t len, unsigned char *out) {
    if (!text || len != MU_UUID_STR_LEN) {
        MU_DBG_DEBUG("invalid UUID length %zu", len);
        return UuidStatus(UuidError::InvalidLength, text ? len : 0);
    }

    for (size_t i = 0; i < sizeof(sepIndex) / sizeof(sepIndex[0]); i++) {
        if (text[sepIndex[i]] != MU_UUID_SEP) {
            MU_DBG_DEBUG("expected '-' at %zu", sepIndex[i]);
            return UuidStatus(UuidError::InvalidFormat, sepIndex[i], text[sepIndex[i]]);
        }
    }

    unsigned char bytes [MU_UUID_SIZE];

    for (size_t i = 0; i < MU_UUID_SIZE; i++) {
        auto status = decodeHexByte(text, 2 * i + sepCount(i), bytes[i]);
        if (!status) {
            MU_DBG_DEBUG("invalid hex digit at %zu", status.position);
            return status;
        }
    }

    memcpy(out, bytes, MU_UUID_SIZE);
    return UuidStatus();
}

} //namespace MicroUuid
