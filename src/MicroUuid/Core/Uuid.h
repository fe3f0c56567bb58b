// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_UUID_H
#define MU_UUID_H

#include <stdint.h>
#include <stddef.h>

#include <MicroUuid/Core/UuidLayout.h>
#include <MicroUuid/Core/UuidError.h>
#include <MicroUuid/Core/TextFormat.h>

namespace MicroUuid {

/*
 * Universally unique identifier as of RFC 4122. Holds its 16 bytes inline in network byte order.
 *
 * Any byte pattern is accepted, also if version and variant are not set. This allows to pass
 * through UUIDs of other systems. Equality and ordering compare the bytes lexicographically,
 * i.e. like a big-endian 128-bit unsigned integer.
 */
class Uuid {
private:
    unsigned char data [MU_UUID_SIZE] = {0};
public:
    Uuid() = default; //nil UUID
    explicit Uuid(const unsigned char (&bytes) [MU_UUID_SIZE]);

    static Uuid fromBytes(const unsigned char *bytes); //reads exactly MU_UUID_SIZE bytes
    static UuidStatus fromSlice(const unsigned char *bytes, size_t len, Uuid& out); //InvalidLength if len != MU_UUID_SIZE

    /*
     * Creates UUID from the fields of a Windows GUID, which keeps d1 - d3 in host byte order.
     * The integer fields are converted to network byte order, d4 (8 bytes) is copied as is
     */
    static Uuid fromGuid(uint32_t d1, uint16_t d2, uint16_t d3, const unsigned char *d4);

    static Uuid nil();
    static Uuid (max)(); //parenthesized against the max() macro of some Arduino cores

    bool isNil() const;
    bool isMax() const;

    const unsigned char *bytes() const {return data;}
    void toBytes(unsigned char *out) const; //writes MU_UUID_SIZE bytes

    uint8_t getVersion() const;
    uint8_t getVariant() const;
    bool isVersion(UuidVersion version) const;
    bool isRfcVariant() const; //variant bits are "10"

    uint32_t timeLow() const;
    uint16_t timeMid() const;
    uint16_t timeHiAndVersion() const;
    uint16_t clockSeq() const;
    void node(unsigned char *out) const; //writes 6 bytes

    Uuid& setVersion(UuidVersion version);
    Uuid& setVariant();

    /*
     * Stamps version 4 and the RFC 4122 variant on the given bytes. It's up to the caller to
     * ensure that the bytes are random
     */
    static Uuid v4From(const unsigned char *random);

    UuidString toString(HexCase hexCase = HexCase::Lower) const;
    UuidString toStringLower() const {return toString(HexCase::Lower);}
    UuidString toStringUpper() const {return toString(HexCase::Upper);}

    /*
     * Writes the canonical form with terminating null into `buf`. Returns the length without
     * terminating null (36), or -1 if `size` is too small
     */
    int print(char *buf, size_t size, HexCase hexCase = HexCase::Lower) const;

    /*
     * Parses the canonical form "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx". `out` is only
     * overwritten on success
     */
    static UuidStatus parse(const char *text, size_t len, Uuid& out);
    static UuidStatus parse(const char *text, Uuid& out); //null-terminated

    int compare(const Uuid& other) const; //<0, 0, >0 like memcmp
};

bool operator==(const Uuid& lhs, const Uuid& rhs);
bool operator!=(const Uuid& lhs, const Uuid& rhs);
bool operator<(const Uuid& lhs, const Uuid& rhs);
bool operator<=(const Uuid& lhs, const Uuid& rhs);
bool operator>(const Uuid& lhs, const Uuid& rhs);
bool operator>=(const Uuid& lhs, const Uuid& rhs);

/*
 * Predefined namespaces for name-based UUIDs (RFC 4122 Appendix C)
 */
Uuid namespaceDns();  //6ba7b810-9dad-11d1-80b4-00c04fd430c8, name is a fully-qualified domain name
Uuid namespaceUrl();  //6ba7b811-9dad-11d1-80b4-00c04fd430c8, name is a URL
Uuid namespaceOid();  //6ba7b812-9dad-11d1-80b4-00c04fd430c8, name is an ISO OID
Uuid namespaceX500(); //6ba7b814-9dad-11d1-80b4-00c04fd430c8, name is an X.500 DN

} //namespace MicroUuid
#endif
