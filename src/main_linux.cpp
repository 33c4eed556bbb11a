#include <keypad_scanner.hpp>
#include <stable_key_filter.hpp>
#include <sysfs_gpio.hpp>
#include <sleep_delay_source.hpp>
#include <keypad_config.hpp>
#include <log.hpp>
#include <csignal>
#include <array>
#include <atomic>
#include <memory>

// Phone keypad geometry
constexpr uint8_t ROWS = 4;
constexpr uint8_t COLS = 3;

std::atomic<bool> running(true);

void signalHandler(int /*signum*/) {
    running = false;
}

extern "C" {
  int app_main(const char* configPath = nullptr);
  int main(int argc, char** argv);
}

int app_main(const char* configPath) {
    try {
        logInfo("Matrix Keypad - Linux");
        logInfo("=====================");

        features::KeypadConfig config;
        const char* path = (configPath != nullptr) ? configPath : "keypad.json";
        if (!config.loadFromFile(path)) {
            logInfo("Usage: program [keypad-config.json]");
            return 1;
        }

        keypad::KeypadLayout<ROWS, COLS> layout = keypad::PHONE_LAYOUT;
        if (!config.toLayout(layout)) {
            return 1;
        }
        if (config.rowGpios.size() != ROWS || config.columnGpios.size() != COLS) {
            logError("Config lists %zu row and %zu column GPIOs, keypad needs %d and %d",
                     config.rowGpios.size(), config.columnGpios.size(), ROWS, COLS);
            return 1;
        }

        // Setup signal handler for graceful shutdown
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        logInfo("\nExporting GPIOs...");
        keypad::KeypadScanner<ROWS, COLS>::RowLines rows;
        for (uint8_t r = 0; r < ROWS; r++) {
            rows[r] = std::make_unique<linux::SysfsGpioRowLine>(config.rowGpios[r]);
        }
        // Non-owning; the scanner owns the columns
        std::array<linux::SysfsGpioColumnLine*, COLS> columnLines;
        keypad::KeypadScanner<ROWS, COLS>::ColumnLines columns;
        for (uint8_t c = 0; c < COLS; c++) {
            auto column = std::make_unique<linux::SysfsGpioColumnLine>(config.columnGpios[c]);
            columnLines[c] = column.get();
            columns[c] = std::move(column);
        }

        keypad::KeypadScanner<ROWS, COLS> scanner(std::move(rows), std::move(columns), layout, config.toScannerConfig());
        keypad::StableKeyFilter filter(config.stableSamples);
        linux::SleepDelaySource delay;

        logInfo("\nScanning keypad (Ctrl+C to stop)...");

        char lastKey = keypad::NO_KEY;
        while (running) {
            char key = filter.update(scanner.scan(delay));

            // A column that cannot be switched may be stuck low and mask other keys
            for (const auto* column : columnLines) {
                if (column->failureCount() > 0) {
                    logError("Keypad column GPIO %u failed to switch, stopping", column->gpio());
                    return 1;
                }
            }

            if (key != lastKey && key != keypad::NO_KEY) {
                logInfo("Key: %c", key);
            }
            lastKey = key;
            delay.delayMicroseconds(config.pollIntervalUs);
        }

        logInfo("\nShutting down...");
        return 0;

    } catch (const std::exception& e) {
        logError("Error: %s", e.what());
        return 1;
    }
}

int main(int argc, char** argv) {
  const char* configPath = (argc > 1) ? argv[1] : nullptr;
  return app_main(configPath);
}
