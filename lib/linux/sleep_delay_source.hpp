#pragma once

#include <matrix_lines.hpp>
#include <cerrno>
#include <ctime>

namespace linux {

/**
 * @brief Delay source that sleeps the calling thread
 *
 * Resumes sleeping after signal interruptions until the full delay has elapsed.
 */
class SleepDelaySource : public keypad::DelaySource {
public:
    void delayMicroseconds(uint32_t us) override {
        struct timespec remaining;
        remaining.tv_sec = us / 1000000;
        remaining.tv_nsec = static_cast<long>(us % 1000000) * 1000;

        while (nanosleep(&remaining, &remaining) == -1 && errno == EINTR) {
        }
    }
};

} // namespace linux
