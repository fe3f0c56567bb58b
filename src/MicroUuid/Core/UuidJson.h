// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_UUIDJSON_H
#define MU_UUIDJSON_H

#include <MicroUuid/Version.h>

#if MU_ENABLE_JSON

#include <stdint.h>

#include <ArduinoJson.h>

#include <MicroUuid/Core/Uuid.h>

namespace MicroUuid {

enum class UuidJsonFormat : uint8_t {
    String, //canonical text form, e.g. "6ba7b810-9dad-11d1-80b4-00c04fd430c8"
    Bytes   //array of 16 integers in network byte order
};

/*
 * Writes `uuid` into the JSON variant `dst`. The string form is copied into the document.
 * Returns false if the document runs out of memory
 */
bool serializeUuid(const Uuid& uuid, JsonVariant dst, UuidJsonFormat format = UuidJsonFormat::String);

/*
 * Reads a UUID from either JSON form. Strings are parsed like Uuid::parse(). Arrays must have
 * exactly 16 integers in the range 0 - 255 (otherwise InvalidLength / InvalidFormat with the
 * index of the offending element). Other JSON types give InvalidFormat
 */
UuidStatus deserializeUuid(JsonVariantConst src, Uuid& out);

} //namespace MicroUuid

#endif //MU_ENABLE_JSON
#endif
