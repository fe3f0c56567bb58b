// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroUuid/Core/RandomGenerator.h>
#include <MicroUuid/Debug.h>

namespace MicroUuid {

UuidStatus generateV4(EntropySource& entropy, Uuid& out) {
    unsigned char random [MU_UUID_SIZE];
    if (!entropy.fill(random, sizeof(random))) {
        MU_DBG_ERR("cannot generate UUID without entropy");
        return UuidStatus(UuidError::EntropySourceUnavailable);
    }
    out = Uuid::v4From(random);
    return UuidStatus();
}

Uuid generateV4(SquaresRng& prng) {
    unsigned char random [MU_UUID_SIZE];
    prng.next128(random);
    return Uuid::v4From(random);
}

} //namespace MicroUuid
