// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroUuid/Core/Entropy.h>
#include <MicroUuid/Debug.h>

using namespace MicroUuid;

bool EntropySourceCb::fill(unsigned char *buf, size_t size) {
    if (!entropyCb) {
        MU_DBG_ERR("no entropy source on this platform");
        return false;
    }

    if (!entropyCb(buf, size)) {
        MU_DBG_ERR("entropy source failed");
        return false;
    }

    return true;
}
