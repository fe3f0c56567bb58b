// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_TEXTFORMAT_H
#define MU_TEXTFORMAT_H

#include <stddef.h>

#include <MicroUuid/Core/UuidError.h>
#include <MicroUuid/Core/HexCodec.h>

#define MU_UUID_STR_LEN 36 //8-4-4-4-12 hex digits and 4 hyphens
#define MU_UUID_STR_SIZE (MU_UUID_STR_LEN + 1) //with terminating null

namespace MicroUuid {

/*
 * Writes the canonical form "xxxxxxxx-xxxx-Mxxx-Nxxx-xxxxxxxxxxxx" of the 16 bytes in `bytes`
 * into `dst`. `dst` must hold MU_UUID_STR_LEN chars. No terminating null is written
 */
void formatUuid(const unsigned char *bytes, char *dst, HexCase hexCase = HexCase::Lower);

/*
 * Parses the canonical form. `text` must be exactly MU_UUID_STR_LEN chars long with hyphens
 * at the indices 8, 13, 18 and 23. Writes 16 bytes into `out` on success only
 */
UuidStatus parseUuid(const char *text, size_t len, unsigned char *out);

/*
 * Null-terminated canonical form in a fixed buffer
 */
struct UuidString {
    char str [MU_UUID_STR_SIZE] = {'\0'};

    const char *c_str() const {return str;}
    size_t size() const {return MU_UUID_STR_LEN;}
    operator const char*() const {return str;}
};

} //namespace MicroUuid
#endif
