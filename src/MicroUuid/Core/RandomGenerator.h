// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_RANDOMGENERATOR_H
#define MU_RANDOMGENERATOR_H

#include <MicroUuid/Core/Uuid.h>
#include <MicroUuid/Core/Entropy.h>
#include <MicroUuid/Core/SquaresRng.h>

namespace MicroUuid {

/*
 * Random UUID (version 4) from 16 bytes of `entropy`. Returns EntropySourceUnavailable if the source
 * fails. `out` is only overwritten on success
 */
UuidStatus generateV4(EntropySource& entropy, Uuid& out);

/*
 * Random UUID (version 4) from the next 128-bit word of `prng`. Unique for the lifetime of `prng`,
 * but predictable
 */
Uuid generateV4(SquaresRng& prng);

} //namespace MicroUuid
#endif
