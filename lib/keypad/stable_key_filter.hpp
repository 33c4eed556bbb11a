#pragma once

#include <keypad_layout.hpp>
#include <cstdint>

namespace keypad {

/**
 * @brief Accepts a scan result only after it repeats a number of times
 *
 * Feed it every result of KeypadScanner::scan(). It reports the last value
 * that was seen on `requiredSamples` consecutive calls, so contact bounce and
 * transients shorter than that many polls are ignored. Releases are filtered
 * the same way as presses.
 */
class StableKeyFilter {
public:
    /**
     * @param requiredSamples Consecutive identical samples needed (0 and 1 accept immediately)
     */
    explicit StableKeyFilter(uint8_t requiredSamples = 3)
        : requiredSamples_(requiredSamples < 1 ? 1 : requiredSamples) {}

    /**
     * @brief Record a new sample
     * @return The current stable value (NO_KEY until a key has been stable long enough)
     */
    char update(char sample) {
        if (sample != candidate_) {
            candidate_ = sample;
            count_ = 0;
        }
        if (count_ < requiredSamples_) {
            count_++;
        }
        if (count_ >= requiredSamples_) {
            stable_ = candidate_;
        }
        return stable_;
    }

    char stable() const { return stable_; }

    void reset() {
        candidate_ = NO_KEY;
        stable_ = NO_KEY;
        count_ = 0;
    }

private:
    uint8_t requiredSamples_;
    char candidate_ = NO_KEY;
    char stable_ = NO_KEY;
    uint8_t count_ = 0;
};

} // namespace keypad
