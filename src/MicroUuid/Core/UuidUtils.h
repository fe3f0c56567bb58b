// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_UUIDUTILS_H
#define MU_UUIDUTILS_H

#include <stdint.h>
#include <stddef.h>

#include <MicroUuid/Core/TextFormat.h>

namespace MicroUuid {
namespace UuidUtils {

// Generates a random UUID (version 4) from four draws of `rng` and writes it into a given buffer
// Returns false if the generation failed
// The buffer must be at least 37 bytes long (36 characters + zero termination)
bool generateUUID(uint32_t (*rng)(), char *uuidBuffer, size_t size);

} //namespace UuidUtils
} //namespace MicroUuid
#endif
