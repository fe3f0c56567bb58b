// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroUuid/Core/Uuid.h>
#include <MicroUuid/Debug.h>

using namespace MicroUuid;

Uuid::Uuid(const unsigned char (&bytes) [MU_UUID_SIZE]) {
    memcpy(data, bytes, MU_UUID_SIZE);
}

Uuid Uuid::fromBytes(const unsigned char *bytes) {
    Uuid uuid;
    memcpy(uuid.data, bytes, MU_UUID_SIZE);
    return uuid;
}

UuidStatus Uuid::fromSlice(const unsigned char *bytes, size_t len, Uuid& out) {
    if (!bytes || len != MU_UUID_SIZE) {
        return UuidStatus(UuidError::InvalidLength, bytes ? len : 0);
    }
    out = fromBytes(bytes);
    return UuidStatus();
}

Uuid Uuid::fromGuid(uint32_t d1, uint16_t d2, uint16_t d3, const unsigned char *d4) {
    Uuid uuid;
    uuid.data[0] = (unsigned char)(d1 >> 24);
    uuid.data[1] = (unsigned char)(d1 >> 16);
    uuid.data[2] = (unsigned char)(d1 >> 8);
    uuid.data[3] = (unsigned char) d1;
    uuid.data[4] = (unsigned char)(d2 >> 8);
    uuid.data[5] = (unsigned char) d2;
    uuid.data[6] = (unsigned char)(d3 >> 8);
    uuid.data[7] = (unsigned char) d3;
    memcpy(uuid.data + 8, d4, 8);
    return uuid;
}

Uuid Uuid::nil() {
    return Uuid();
}

Uuid (Uuid::max)() {
    Uuid uuid;
    memset(uuid.data, 0xFF, MU_UUID_SIZE);
    return uuid;
}

bool Uuid::isNil() const {
    for (size_t i = 0; i < MU_UUID_SIZE; i++) {
        if (data[i] != 0x00) {
            return false;
        }
    }
    return true;
}

bool Uuid::isMax() const {
    for (size_t i = 0; i < MU_UUID_SIZE; i++) {
        if (data[i] != 0xFF) {
            return false;
        }
    }
    return true;
}

void Uuid::toBytes(unsigned char *out) const {
    memcpy(out, data, MU_UUID_SIZE);
}

uint8_t Uuid::getVersion() const {
    return MicroUuid::getVersion(data);
}

uint8_t Uuid::getVariant() const {
    return MicroUuid::getVariant(data);
}

bool Uuid::isVersion(UuidVersion version) const {
    return getVersion() == static_cast<uint8_t>(version);
}

bool Uuid::isRfcVariant() const {
    return getVariant() == MU_UUID_VARIANT_RFC4122;
}

uint32_t Uuid::timeLow() const {
    return getTimeLow(data);
}

uint16_t Uuid::timeMid() const {
    return getTimeMid(data);
}

uint16_t Uuid::timeHiAndVersion() const {
    return getTimeHiAndVersion(data);
}

uint16_t Uuid::clockSeq() const {
    return getClockSeq(data);
}

void Uuid::node(unsigned char *out) const {
    getNode(data, out);
}

Uuid& Uuid::setVersion(UuidVersion version) {
    MicroUuid::setVersion(data, version);
    return *this;
}

Uuid& Uuid::setVariant() {
    MicroUuid::setVariant(data);
    return *this;
}

Uuid Uuid::v4From(const unsigned char *random) {
    Uuid uuid = fromBytes(random);
    uuid.setVersion(UuidVersion::Random).setVariant();
    return uuid;
}

UuidString Uuid::toString(HexCase hexCase) const {
    UuidString res;
    formatUuid(data, res.str, hexCase);
    res.str[MU_UUID_STR_LEN] = '\0';
    return res;
}

int Uuid::print(char *buf, size_t size, HexCase hexCase) const {
    if (!buf || size < MU_UUID_STR_SIZE) {
        MU_DBG_ERR("buffer too small (%zu < %i)", size, MU_UUID_STR_SIZE);
        return -1;
    }
    formatUuid(data, buf, hexCase);
    buf[MU_UUID_STR_LEN] = '\0';
    return MU_UUID_STR_LEN;
}

UuidStatus Uuid::parse(const char *text, size_t len, Uuid& out) {
    return parseUuid(text, len, out.data);
}

UuidStatus Uuid::parse(const char *text, Uuid& out) {
    return parse(text, text ? strlen(text) : 0, out);
}

int Uuid::compare(const Uuid& other) const {
    return memcmp(data, other.data, MU_UUID_SIZE);
}

namespace MicroUuid {

bool operator==(const Uuid& lhs, const Uuid& rhs) {
    return lhs.compare(rhs) == 0;
}

bool operator!=(const Uuid& lhs, const Uuid& rhs) {
    return !(lhs == rhs);
}

bool operator<(const Uuid& lhs, const Uuid& rhs) {
    return lhs.compare(rhs) < 0;
}

bool operator<=(const Uuid& lhs, const Uuid& rhs) {
    return lhs.compare(rhs) <= 0;
}

bool operator>(const Uuid& lhs, const Uuid& rhs) {
    return lhs.compare(rhs) > 0;
}

bool operator>=(const Uuid& lhs, const Uuid& rhs) {
    return lhs.compare(rhs) >= 0;
}

namespace {

//RFC 4122 namespaces only differ in the last byte of time_low
Uuid makeNamespace(unsigned char timeLowLsb) {
    const unsigned char bytes [MU_UUID_SIZE] = {
        0x6b, 0xa7, 0xb8, timeLowLsb,
        0x9d, 0xad,
        0x11, 0xd1,
        0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
    };
    return Uuid(bytes);
}

} //namespace

Uuid namespaceDns() {
    return makeNamespace(0x10);
}

Uuid namespaceUrl() {
    return makeNamespace(0x11);
}

Uuid namespaceOid() {
    return makeNamespace(0x12);
}

Uuid namespaceX500() {
    return makeNamespace(0x14);
}

} //namespace MicroUuid
