// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MU_PLATFORM_H
#define MU_PLATFORM_H

#include <stdint.h>
#include <stddef.h>

#define MU_PLATFORM_NONE    0
#define MU_PLATFORM_ARDUINO 1
#define MU_PLATFORM_ESPIDF  2
#define MU_PLATFORM_UNIX    3

#ifndef MU_PLATFORM
#define MU_PLATFORM MU_PLATFORM_ARDUINO
#endif

#ifdef __cplusplus
namespace MicroUuid {

void (*getDefaultDebugCb())(const char*);

/*
 * Wall clock in ms. Only used for seeding the pseudo random generator, so it doesn't need to be
 * synchronized. Null if the platform has no clock
 */
uint64_t (*getDefaultClockCb())();

/*
 * Secure random bytes of the OS. Returns true if `size` bytes have been written into `buf`. Null
 * if the platform has no secure entropy source
 */
bool (*getDefaultEntropyCb())(unsigned char *buf, size_t size);

} //namespace MicroUuid
#endif //__cplusplus

#ifndef MU_ENABLE_MBEDTLS
#define MU_ENABLE_MBEDTLS 1
#endif

#endif
