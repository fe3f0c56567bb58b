// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <Arduino.h>

#include <MicroUuid.h>

using namespace MicroUuid;

#define DEVICE_NAME "esp-charger.example.com"

SquaresRng *prng = nullptr;

void setup() {

    /*
     * Initialize Serial
     */ 

    Serial.begin(115200);

    /*
     * Stable device ID. Derived from the device name, so it stays the same after each restart
     */
    Uuid deviceId;
    if (uuidV5(namespaceDns(), DEVICE_NAME, deviceId)) {
        Serial.printf("[main] Device ID: %s\n", deviceId.toString().c_str());
    } else {
        Serial.println(F("[main] Device ID not available"));
    }

    /*
     * Random message ID from the hardware RNG of the ESP
     */
    Uuid msgId;
    auto status = uuidV4(msgId);
    if (status) {
        Serial.printf("[main] Message ID: %s\n", msgId.toString().c_str());
    } else {
        Serial.printf("[main] Message ID not available: %s\n", serializeUuidError(status.error));
    }

    /*
     * Fast IDs for log records. Unique, but predictable. Don't use them as secrets
     */
#if defined(ESP32)
    uint64_t seed = ESP.getEfuseMac();
#else
    uint64_t seed = ESP.getChipId();
#endif
    prng = new SquaresRng(makeClockSeededRng(seed));
}

void loop() {

    static unsigned long lastRecord = 0;

    if (millis() - lastRecord >= 5000) {
        lastRecord = millis();

        auto recordId = generateV4(*prng);
        Serial.printf("[main] Record %s\n", recordId.toStringUpper().c_str());
    }
}
