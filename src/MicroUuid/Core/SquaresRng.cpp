// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroUuid/Core/SquaresRng.h>

using namespace MicroUuid;

namespace {

uint64_t rotate32(uint64_t x) {
    return (x >> 32) | (x << 32);
}

//splitmix64 finalizer. Spreads seeds like 0, 1, 2 over all bits of the key
uint64_t mixKey(uint64_t z) {
    z += 0x9e3779b97f4a7c15ULL;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

} //namespace

SquaresRng::SquaresRng(uint64_t seed, uint64_t time) : key(mixKey(seed ^ mixKey(time)) | 1ULL) {

}

SquaresRng SquaresRng::restore(uint64_t key, uint64_t counter) {
    SquaresRng rng (0);
    rng.key = key;
    rng.counter = counter;
    return rng;
}

uint32_t SquaresRng::next32() {
    uint64_t x, y, z;
    y = x = counter++ * key;
    z = y + key;
    x = rotate32(x*x + y);
    x = rotate32(x*x + z);
    x = rotate32(x*x + y);
    return (uint32_t)((x*x + z) >> 32);
}

uint64_t SquaresRng::next64() {
    uint64_t t, x, y, z;
    y = x = counter++ * key;
    z = y + key;
    x = rotate32(x*x + y);
    x = rotate32(x*x + z);
    x = rotate32(x*x + y);
    t = x = x*x + z;
    x = rotate32(x);
    return t ^ ((x*x + y) >> 32);
}

void SquaresRng::next128(unsigned char *out) {
    uint64_t hi = next64();
    uint64_t lo = next64();
    for (int i = 0; i < 8; i++) {
        out[i] = (unsigned char)(hi >> (56 - 8 * i));
        out[8 + i] = (unsigned char)(lo >> (56 - 8 * i));
    }
}
