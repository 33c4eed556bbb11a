#ifndef KEYPAD_CONFIG_HPP
#define KEYPAD_CONFIG_HPP

#include <keypad_layout.hpp>
#include <scanner_config.hpp>
#include <log.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

namespace features {

/**
 * @brief Keypad wiring, layout and timing loaded from a JSON file
 *
 * Only available on platforms with filesystem support. Members keep their
 * defaults when the document omits them, so an empty object `{}` describes a
 * phone keypad with default timing (GPIO lists are then empty and must be
 * supplied for real hardware).
 *
 * Example:
 * @code
 * {
 *   "layout": ["123", "456", "789", "*0#"],
 *   "rowGpios": [5, 6, 13, 19],
 *   "columnGpios": [12, 16, 20],
 *   "settleTimeUs": 1000,
 *   "pollIntervalUs": 10000,
 *   "stableSamples": 3
 * }
 * @endcode
 */
struct KeypadConfig {
    static constexpr uint64_t MAX_SETTLE_TIME_US = 1000000;
    static constexpr uint64_t MAX_POLL_INTERVAL_US = 60000000;

    std::vector<std::string> layout = {"123", "456", "789", "*0#"};
    std::vector<unsigned int> rowGpios;
    std::vector<unsigned int> columnGpios;
    uint32_t settleTimeUs = keypad::ScannerConfig::DEFAULT_SETTLE_TIME_US;
    uint32_t pollIntervalUs = keypad::ScannerConfig::DEFAULT_POLL_INTERVAL_US;
    uint8_t stableSamples = 3;

    /**
     * @brief Load configuration from a JSON file
     * @param path File to read
     * @return true if the file exists, parsed and every value is in range;
     *         false leaves this object unchanged
     */
    bool loadFromFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            logWarn("Keypad config %s not found, using defaults", path.c_str());
            return false;
        }

        try {
            nlohmann::json j;
            file >> j;
            if (!fromJson(j)) {
                logError("Keypad config %s rejected", path.c_str());
                return false;
            }
            logInfo("Loaded keypad config from %s", path.c_str());
            return true;
        } catch (const std::exception& e) {
            logError("Error loading keypad config %s: %s", path.c_str(), e.what());
            return false;
        }
    }

    /**
     * @brief Parse configuration from an in-memory JSON document
     * @return true if parsed and in range; false leaves this object unchanged
     */
    bool parse(const std::string& text) {
        try {
            return fromJson(nlohmann::json::parse(text));
        } catch (const std::exception& e) {
            logError("Error parsing keypad config: %s", e.what());
            return false;
        }
    }

    keypad::ScannerConfig toScannerConfig() const {
        keypad::ScannerConfig config;
        config.settleTimeUs = settleTimeUs;
        config.pollIntervalUs = pollIntervalUs;
        return config;
    }

    /**
     * @brief Convert the layout strings to a fixed-size layout
     * @return false if the layout does not have exactly Rows x Cols keys
     */
    template<uint8_t Rows, uint8_t Cols>
    bool toLayout(keypad::KeypadLayout<Rows, Cols>& out) const {
        return keypad::KeypadLayout<Rows, Cols>::fromStrings(layout, out);
    }

    /**
     * @brief Assign from a parsed document after checking numeric ranges
     *
     * nlohmann/json narrows numbers to the member types without a range check,
     * so -1 would become 4294967295 us and 300 samples would become 44.
     * @throws nlohmann::json::exception on a type mismatch
     */
    bool fromJson(const nlohmann::json& j) {
        const uint64_t maxGpio = std::numeric_limits<int>::max();
        if (!checkNumber(j, "settleTimeUs", 1, MAX_SETTLE_TIME_US) ||
            !checkNumber(j, "pollIntervalUs", 0, MAX_POLL_INTERVAL_US) ||
            !checkNumber(j, "stableSamples", 0, std::numeric_limits<uint8_t>::max()) ||
            !checkNumbers(j, "rowGpios", maxGpio) ||
            !checkNumbers(j, "columnGpios", maxGpio)) {
            return false;
        }
        *this = j.get<KeypadConfig>();
        return true;
    }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(KeypadConfig,
        layout,
        rowGpios,
        columnGpios,
        settleTimeUs,
        pollIntervalUs,
        stableSamples
    )

private:
    static bool inRange(const nlohmann::json& value, uint64_t min, uint64_t max) {
        // Non-negative integers parse as number_unsigned; negatives and fractions never fit
        if (!value.is_number_unsigned()) {
            return false;
        }
        uint64_t n = value.get<uint64_t>();
        return n >= min && n <= max;
    }

    static bool checkNumber(const nlohmann::json& j, const char* key, uint64_t min, uint64_t max) {
        auto it = j.find(key);
        // Absent keys keep their default; non-numbers are left to the type check in get()
        if (it == j.end() || !it->is_number()) {
            return true;
        }
        if (!inRange(*it, min, max)) {
            logError("Keypad config: %s must be an integer from %llu to %llu, got %s", key,
                     static_cast<unsigned long long>(min), static_cast<unsigned long long>(max),
                     it->dump().c_str());
            return false;
        }
        return true;
    }

    static bool checkNumbers(const nlohmann::json& j, const char* key, uint64_t max) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_array()) {
            return true;
        }
        for (const auto& value : *it) {
            if (value.is_number() && !inRange(value, 0, max)) {
                logError("Keypad config: %s entry %s is not a valid GPIO number", key, value.dump().c_str());
                return false;
            }
        }
        return true;
    }
};

} // namespace features

#endif // KEYPAD_CONFIG_HPP
