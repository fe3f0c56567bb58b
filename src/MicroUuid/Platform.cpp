// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroUuid/Platform.h>

#if MU_PLATFORM == MU_PLATFORM_ARDUINO
#include <Arduino.h>
#ifndef MU_USE_SERIAL
#define MU_USE_SERIAL Serial
#endif

#if defined(ESP32) || defined(ESP8266)
#include <esp_system.h>
#define MU_HAS_ESP_RANDOM 1
#endif

namespace MicroUuid {

void defaultDebugCbImpl(const char *msg) {
    MU_USE_SERIAL.printf("%s", msg);
}

uint64_t defaultClockCbImpl() {
    return (uint64_t) millis(); //no wall clock, but good enough for seeding
}

} //namespace MicroUuid

#elif MU_PLATFORM == MU_PLATFORM_ESPIDF
#include <stdio.h>
#include <sys/time.h>
#include <esp_random.h>
#define MU_HAS_ESP_RANDOM 1

namespace MicroUuid {

void defaultDebugCbImpl(const char *msg) {
    printf("%s", msg);
}

uint64_t defaultClockCbImpl() {
    struct timeval tv;
    if (gettimeofday(&tv, nullptr)) {
        return 0;
    }
    return (uint64_t) tv.tv_sec * 1000ULL + (uint64_t) tv.tv_usec / 1000ULL;
}

} //namespace MicroUuid

#elif MU_PLATFORM == MU_PLATFORM_UNIX
#include <stdio.h>
#include <errno.h>
#include <sys/random.h>
#include <chrono>

namespace MicroUuid {

void defaultDebugCbImpl(const char *msg) {
    printf("%s", msg);
}

uint64_t defaultClockCbImpl() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());
    return (uint64_t) ms.count();
}

bool defaultEntropyCbImpl(unsigned char *buf, size_t size) {
    size_t filled = 0;
    while (filled < size) {
        ssize_t ret = getrandom(buf + filled, size - filled, 0);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        filled += (size_t) ret;
    }
    return true;
}

} //namespace MicroUuid
#else
namespace MicroUuid {
void (*defaultDebugCbImpl)(const char*) = nullptr;
uint64_t (*defaultClockCbImpl)() = nullptr;
} //namespace MicroUuid
#endif

#if MU_HAS_ESP_RANDOM
namespace MicroUuid {

bool defaultEntropyCbImpl(unsigned char *buf, size_t size) {
    esp_fill_random(buf, size); //true random as long as the RF subsystem is enabled
    return true;
}

} //namespace MicroUuid
#elif MU_PLATFORM != MU_PLATFORM_UNIX
namespace MicroUuid {
bool (*defaultEntropyCbImpl)(unsigned char*, size_t) = nullptr;
} //namespace MicroUuid
#endif

namespace MicroUuid {

void (*getDefaultDebugCb())(const char*) {
    return defaultDebugCbImpl;
}

uint64_t (*getDefaultClockCb())() {
    return defaultClockCbImpl;
}

bool (*getDefaultEntropyCb())(unsigned char*, size_t) {
    return defaultEntropyCbImpl;
}

} //namespace MicroUuid
