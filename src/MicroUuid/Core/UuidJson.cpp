// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroUuid/Core/UuidJson.h>

#if MU_ENABLE_JSON

#include <MicroUuid/Debug.h>

namespace MicroUuid {

bool serializeUuid(const Uuid& uuid, JsonVariant dst, UuidJsonFormat format) {
    if (format == UuidJsonFormat::Bytes) {
        JsonArray arr = dst.to<JsonArray>();
        if (arr.isNull()) {
            MU_DBG_ERR("OOM");
            return false;
        }
        for (size_t i = 0; i < MU_UUID_SIZE; i++) {
            if (!arr.add(uuid.bytes()[i])) {
                MU_DBG_ERR("OOM");
                return false;
            }
        }
        return true;
    }

    char buf [MU_UUID_STR_SIZE];
    if (uuid.print(buf, sizeof(buf)) < 0) {
        MU_DBG_ERR("internal error");
        return false;
    }

    //non-const char* makes ArduinoJson copy the string into the document
    if (!dst.set(static_cast<char*>(buf))) {
        MU_DBG_ERR("OOM");
        return false;
    }
    return true;
}

UuidStatus deserializeUuid(JsonVariantConst src, Uuid& out) {
    if (src.is<const char*>()) {
        return Uuid::parse(src.as<const char*>(), out);
    }

    if (!src.is<JsonArrayConst>()) {
        MU_DBG_DEBUG("UUID must be string or byte array");
        return UuidStatus(UuidError::InvalidFormat);
    }

    JsonArrayConst arr = src.as<JsonArrayConst>();
    if (arr.size() != MU_UUID_SIZE) {
        MU_DBG_DEBUG("UUID byte array has invalid length %zu", arr.size());
        return UuidStatus(UuidError::InvalidLength, arr.size());
    }

    unsigned char bytes [MU_UUID_SIZE];

    size_t i = 0;
    for (JsonVariantConst byte : arr) {
        if (!byte.is<int>() || byte.as<int>() < 0 || byte.as<int>() > 0xFF) {
            MU_DBG_DEBUG("UUID byte %zu out of range", i);
            return UuidStatus(UuidError::InvalidFormat, i);
        }
        bytes[i] = (unsigned char) byte.as<int>();
        i++;
    }

    out = Uuid::fromBytes(bytes);
    return UuidStatus();
}

} //namespace MicroUuid

#endif //MU_ENABLE_JSON
