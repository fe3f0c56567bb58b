// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_TESTHELPER_H
#define MU_TESTHELPER_H

#include <stdint.h>
#include <stddef.h>

#include <string>
#include <vector>

#include <MicroUuid/Core/Digest.h>
#include <MicroUuid/Core/Entropy.h>

/**
* Prints a string to the c standart console and appends it to `consoleOut`
*
* @param msg pointer to the string
*/
void cpp_console_out(const char *msg);

extern std::string consoleOut;

//set by the test run listener after routing the debug output into `consoleOut`
extern bool testRunStarted;

/*
 * Stand-in hash function. Records the concatenated input and outputs `outputSize` bytes which
 * only depend on the input
 */
class RecordingDigest : public MicroUuid::DigestFunction {
public:
    std::vector<unsigned char> input;
    size_t outputSize;
    int calls = 0;
    bool fail = false;

    RecordingDigest(size_t outputSize = 20) : outputSize(outputSize) { }

    int digest(const MicroUuid::DigestInput *parts, size_t count, unsigned char *out, size_t size) override;
};

/*
 * Stand-in entropy source. Fills the bytes `first`, `first + step`, `first + 2 * step`, ...
 */
class ScriptedEntropy : public MicroUuid::EntropySource {
public:
    unsigned char first;
    unsigned char step;
    bool available = true;
    int calls = 0;

    ScriptedEntropy(unsigned char first = 0x00, unsigned char step = 0x00) : first(first), step(step) { }

    bool fill(unsigned char *buf, size_t size) override;
};

extern uint32_t rng_counter;
uint32_t counting_rng_cb();

#endif
