// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_ENTROPY_H
#define MU_ENTROPY_H

#include <stddef.h>

namespace MicroUuid {

/*
 * Interface to a secure source of random bytes, e.g. the RNG of the OS or the entropy pool of the
 * local crypto library
 */
class EntropySource {
public:
    virtual ~EntropySource() = default;

    /*
     * Writes `size` random bytes into `buf`. Returns false if the source is unavailable. Must not
     * fall back to a weaker source. May block until the platform has gathered enough entropy
     */
    virtual bool fill(unsigned char *buf, size_t size) = 0;
};

/*
 * Entropy source which forwards to a C callback, e.g. the platform default getDefaultEntropyCb()
 */
class EntropySourceCb : public EntropySource {
private:
    bool (*entropyCb)(unsigned char *buf, size_t size) = nullptr;
public:
    EntropySourceCb(bool (*entropyCb)(unsigned char *buf, size_t size)) : entropyCb(entropyCb) { }

    bool fill(unsigned char *buf, size_t size) override;
};

} //namespace MicroUuid
#endif
