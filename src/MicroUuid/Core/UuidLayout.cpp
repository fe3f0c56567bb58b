// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroUuid/Core/UuidLayout.h>

namespace MicroUuid {

void setVersion(unsigned char *bytes, UuidVersion version) {
    bytes[MU_UUID_VERSION_INDEX] = (unsigned char)((static_cast<uint8_t>(version) << 4) | (bytes[MU_UUID_VERSION_INDEX] & 0x0F));
}

void setVariant(unsigned char *bytes) {
    bytes[MU_UUID_VARIANT_INDEX] = (unsigned char)((bytes[MU_UUID_VARIANT_INDEX] & 0x3F) | 0x80);
}

uint8_t getVersion(const unsigned char *bytes) {
    return bytes[MU_UUID_VERSION_INDEX] >> 4;
}

uint8_t getVariant(const unsigned char *bytes) {
    return bytes[MU_UUID_VARIANT_INDEX] >> 6;
}

uint32_t getTimeLow(const unsigned char *bytes) {
    return ((uint32_t) bytes[0] << 24) |
           ((uint32_t) bytes[1] << 16) |
           ((uint32_t) bytes[2] << 8) |
            (uint32_t) bytes[3];
}

uint16_t getTimeMid(const unsigned char *bytes) {
    return (uint16_t)((bytes[4] << 8) | bytes[5]);
}

uint16_t getTimeHiAndVersion(const unsigned char *bytes) {
    return (uint16_t)((bytes[6] << 8) | bytes[7]);
}

uint16_t getClockSeq(const unsigned char *bytes) {
    return (uint16_t)((bytes[8] << 8) | bytes[9]);
}

void getNode(const unsigned char *bytes, unsigned char *out) {
    memcpy(out, bytes + 10, 6);
}

} //namespace MicroUuid
