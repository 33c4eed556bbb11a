#pragma once

#include <matrix_lines.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <esp_rom_sys.h>

namespace esp32 {

/**
 * @brief Delay source for FreeRTOS tasks
 *
 * Whole scheduler ticks are slept with vTaskDelay so long poll intervals let
 * other tasks (and the idle task watchdog) run. The sub-tick remainder, which
 * covers typical settle times, is busy-waited with the ROM delay.
 */
class FreeRtosDelaySource : public keypad::DelaySource {
public:
    void delayMicroseconds(uint32_t us) override {
        const uint32_t tickUs = portTICK_PERIOD_MS * 1000;
        const uint32_t ticks = us / tickUs;

        if (ticks > 0) {
            vTaskDelay(ticks);
        }
        const uint32_t remainder = us % tickUs;
        if (remainder > 0) {
            esp_rom_delay_us(remainder);
        }
    }
};

} // namespace esp32
