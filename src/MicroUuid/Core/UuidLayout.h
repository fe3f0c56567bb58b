// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_UUIDLAYOUT_H
#define MU_UUIDLAYOUT_H

#include <stdint.h>
#include <stddef.h>

#define MU_UUID_SIZE 16 //binary UUID is always 16 bytes

#define MU_UUID_VERSION_INDEX 6 //high nibble of time_hi_and_version
#define MU_UUID_VARIANT_INDEX 8 //high bits of clock_seq_hi_and_reserved

#define MU_UUID_VARIANT_RFC4122 0x2 //binary 10

namespace MicroUuid {

/*
 * Version field, i.e. the algorithm which generated the UUID (see RFC 4122 section 4.1.3)
 */
enum class UuidVersion : uint8_t {
    Nil = 0, //special case for the nil UUID
    Mac = 1,
    Dce = 2,
    Md5 = 3,
    Random = 4,
    Sha1 = 5
};

/*
 * Field encoders on the raw 16-byte buffer. All bytes apart from the version nibble and
 * the variant bits are preserved
 */
void setVersion(unsigned char *bytes, UuidVersion version);
void setVariant(unsigned char *bytes); //only the RFC 4122 variant "10" is supported

uint8_t getVersion(const unsigned char *bytes); //4-bit version number, may be > 5 for foreign UUIDs
uint8_t getVariant(const unsigned char *bytes); //2 most significant bits of byte 8

/*
 * RFC 4122 fields in network byte order. See section 4.1.2
 */
uint32_t getTimeLow(const unsigned char *bytes);
uint16_t getTimeMid(const unsigned char *bytes);
uint16_t getTimeHiAndVersion(const unsigned char *bytes);
uint16_t getClockSeq(const unsigned char *bytes); //clock_seq_hi_and_reserved and clock_seq_low
void getNode(const unsigned char *bytes, unsigned char *out); //writes 6 bytes

} //namespace MicroUuid
#endif
