#pragma once

#include <keypad_layout.hpp>
#include <scanner_config.hpp>
#include <esp32_gpio_lines.hpp>
#include <keypad_scanner.hpp>
#include <log.hpp>
#include <memory>

namespace esp32 {

/**
 * @brief Compiled-in keypad wiring for platforms without filesystem
 *
 * 4x3 membrane keypad on an ESP32 DEVKIT V1. Check the connector pinout of
 * the pad in use; it varies between vendors.
 */
class EmbeddedKeypadConfig {
public:
    static constexpr uint8_t ROWS = 4;
    static constexpr uint8_t COLS = 3;

    // Avoids strapping pins (0, 2, 12, 15) and input-only pins (34-39, no pull-up)
    static constexpr gpio_num_t ROW_GPIOS[ROWS] = {GPIO_NUM_13, GPIO_NUM_14, GPIO_NUM_27, GPIO_NUM_26};
    static constexpr gpio_num_t COLUMN_GPIOS[COLS] = {GPIO_NUM_25, GPIO_NUM_33, GPIO_NUM_32};

    static keypad::ScannerConfig scannerConfig() {
        keypad::ScannerConfig config;
        config.settleTimeUs = 50;      // Internal pull-ups on short traces settle quickly
        config.pollIntervalUs = 10000;
        return config;
    }

    /**
     * @brief Configure the GPIOs and build the scanner
     * @throws std::runtime_error if a GPIO cannot be configured
     */
    static std::unique_ptr<keypad::PhoneKeypadScanner> createScanner() {
        keypad::PhoneKeypadScanner::RowLines rows;
        for (uint8_t r = 0; r < ROWS; r++) {
            rows[r] = std::make_unique<GpioRowLine>(ROW_GPIOS[r]);
        }

        keypad::PhoneKeypadScanner::ColumnLines columns;
        for (uint8_t c = 0; c < COLS; c++) {
            columns[c] = std::make_unique<GpioColumnLine>(COLUMN_GPIOS[c]);
        }

        logInfo("Using embedded keypad wiring");
        return std::make_unique<keypad::PhoneKeypadScanner>(
            std::move(rows), std::move(columns), keypad::PHONE_LAYOUT, scannerConfig());
    }
};

} // namespace esp32
