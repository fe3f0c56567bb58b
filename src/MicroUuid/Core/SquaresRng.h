// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_SQUARESRNG_H
#define MU_SQUARESRNG_H

#include <stdint.h>

namespace MicroUuid {

/*
 * Counter-based pseudo random generator (B. Widynski, "Squares: A Fast Counter-Based RNG", 2020).
 * Each draw squares the running counter with a key derived from `seed` and `time`.
 *
 * Not secure: whoever knows seed and time can reproduce all outputs of an instance. Each instance
 * owns its state and there is no locking. Seed from the clock (see getDefaultClockCb()) to not
 * repeat the same sequence after each restart, or with a constant in tests
 */
class SquaresRng {
private:
    uint64_t key;
    uint64_t counter = 0;
public:
    SquaresRng(uint64_t seed, uint64_t time = 0);

    //continue a generator from its saved key and counter
    static SquaresRng restore(uint64_t key, uint64_t counter);

    uint32_t next32();
    uint64_t next64();
    void next128(unsigned char *out); //writes 16 bytes

    uint64_t getKey() const {return key;}
    uint64_t getCounter() const {return counter;}
};

} //namespace MicroUuid
#endif
