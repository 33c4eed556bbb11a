#pragma once

#include <cstdint>

namespace keypad {

/**
 * @brief Timing parameters of a keypad scanner
 */
struct ScannerConfig {
    static constexpr uint32_t DEFAULT_SETTLE_TIME_US = 1000;     // 1ms, tolerates long ribbon cables
    static constexpr uint32_t DEFAULT_POLL_INTERVAL_US = 10000;  // 100Hz

    // Wait between driving a column and sampling rows. Must be non-zero.
    uint32_t settleTimeUs = DEFAULT_SETTLE_TIME_US;

    // Wait between two passes while readChar() waits for a key. 0 = back to back.
    uint32_t pollIntervalUs = DEFAULT_POLL_INTERVAL_US;
};

} // namespace keypad
