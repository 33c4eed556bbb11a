#include <embedded_keypad_config.hpp>
#include <freertos_delay_source.hpp>
#include <keypad_scanner.hpp>
#include <log.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <exception>
#include <memory>

// Global instances
static std::unique_ptr<keypad::PhoneKeypadScanner> gScanner;

/**
 * @brief Keypad task - waits for keys and reports each press once
 */
void keypadTask(void* parameter) {
    esp32::FreeRtosDelaySource delay;
    const uint32_t pollIntervalUs = gScanner->config().pollIntervalUs;

    logInfo("Keypad task started on core %d", xPortGetCoreID());

    while (true) {
        char key = gScanner->readChar(delay);
        logInfo("Key: %c", key);

        // Wait for release so a held key is reported once
        while (gScanner->scan(delay) != keypad::NO_KEY) {
            delay.delayMicroseconds(pollIntervalUs);
        }
    }
}

extern "C" void app_main(void) {
    logInfo("Matrix Keypad - ESP32");
    logInfo("=====================");

    try {
        logInfo("Configuring keypad GPIOs...");
        gScanner = esp32::EmbeddedKeypadConfig::createScanner();
    } catch (const std::exception& e) {
        logError("Keypad setup failed: %s", e.what());
        return;
    }

    TaskHandle_t keypadTaskHandle = nullptr;
    xTaskCreate(
        keypadTask,
        "keypad",
        4096,    // Stack size
        nullptr,
        1,       // Priority (low)
        &keypadTaskHandle
    );

    if (keypadTaskHandle == nullptr) {
        logError("Failed to create keypad task!");
        return;
    }

    logInfo("Press keys on the keypad");

    // All work is now in the keypad task. Just idle.
    while (true) {
        vTaskDelay(pdMS_TO_TICKS(10000));
    }
}
