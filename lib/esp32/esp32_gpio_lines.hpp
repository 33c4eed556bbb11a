#pragma once

#include <matrix_lines.hpp>
#include <driver/gpio.h>
#include <esp_err.h>
#include <stdexcept>
#include <log.hpp>

namespace esp32 {

/**
 * @brief Keypad row on an ESP32 GPIO with the internal pull-up enabled
 *
 * The internal pull-up (~45kΩ) is enough for short keypad ribbons. Add an
 * external 10kΩ pull-up for long cables.
 */
class GpioRowLine : public keypad::RowLine {
public:
    /**
     * @throws std::runtime_error if the pin cannot be configured
     */
    explicit GpioRowLine(gpio_num_t gpio) : gpio_(gpio) {
        gpio_config_t io = {};
        io.pin_bit_mask = 1ULL << gpio_;
        io.mode = GPIO_MODE_INPUT;
        io.pull_up_en = GPIO_PULLUP_ENABLE;
        io.pull_down_en = GPIO_PULLDOWN_DISABLE;
        io.intr_type = GPIO_INTR_DISABLE;

        esp_err_t err = gpio_config(&io);
        if (err != ESP_OK) {
            logError("Failed to configure keypad row GPIO %d: %s", gpio_, esp_err_to_name(err));
            throw std::runtime_error("Keypad row GPIO configuration failed");
        }
    }

    bool isAsserted() const override {
        return gpio_get_level(gpio_) == 0;
    }

private:
    gpio_num_t gpio_;
};

/**
 * @brief Keypad column on an ESP32 GPIO in open-drain mode
 *
 * Idle level is high (transistor off), so the column floats and never fights
 * another column through a pair of closed keys.
 */
class GpioColumnLine : public keypad::ColumnLine {
public:
    /**
     * @throws std::runtime_error if the pin cannot be configured
     */
    explicit GpioColumnLine(gpio_num_t gpio) : gpio_(gpio) {
        gpio_config_t io = {};
        io.pin_bit_mask = 1ULL << gpio_;
        io.mode = GPIO_MODE_INPUT_OUTPUT_OD;
        io.pull_up_en = GPIO_PULLUP_ENABLE;
        io.pull_down_en = GPIO_PULLDOWN_DISABLE;
        io.intr_type = GPIO_INTR_DISABLE;

        // Latch the idle level before the output stage is enabled
        esp_err_t err = gpio_set_level(gpio_, 1);
        if (err == ESP_OK) {
            err = gpio_config(&io);
        }
        if (err != ESP_OK) {
            logError("Failed to configure keypad column GPIO %d: %s", gpio_, esp_err_to_name(err));
            throw std::runtime_error("Keypad column GPIO configuration failed");
        }
    }

    void driveLow() override {
        esp_err_t err = gpio_set_level(gpio_, 0);
        if (err != ESP_OK) {
            logError("Keypad column GPIO %d: cannot drive low: %s", gpio_, esp_err_to_name(err));
        }
    }

    bool release() override {
        esp_err_t err = gpio_set_level(gpio_, 1);
        if (err != ESP_OK) {
            logError("Keypad column GPIO %d: cannot release: %s", gpio_, esp_err_to_name(err));
            return false;
        }
        return true;
    }

private:
    gpio_num_t gpio_;
};

} // namespace esp32
