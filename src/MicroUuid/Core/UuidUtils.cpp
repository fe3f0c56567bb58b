// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroUuid/Core/UuidUtils.h>
#include <MicroUuid/Core/Uuid.h>
#include <MicroUuid/Debug.h>

namespace MicroUuid {
namespace UuidUtils {

bool generateUUID(uint32_t (*rng)(), char *uuidBuffer, size_t size) {
    if (!rng) {
        MU_DBG_ERR("no RNG");
        return false;
    }

    if (!uuidBuffer || size < MU_UUID_STR_SIZE) {
        MU_DBG_ERR("buffer too small");
        return false;
    }

    unsigned char random [MU_UUID_SIZE];
    for (size_t i = 0; i < MU_UUID_SIZE; i += 4) {
        uint32_t r = rng();
        random[i]     = (unsigned char)(r >> 24);
        random[i + 1] = (unsigned char)(r >> 16);
        random[i + 2] = (unsigned char)(r >> 8);
        random[i + 3] = (unsigned char) r;
    }

    return Uuid::v4From(random).print(uuidBuffer, size) == MU_UUID_STR_LEN;
}

} //namespace UuidUtils
} //namespace MicroUuid
