#pragma once

#include <cstdint>

namespace keypad {

/**
 * @brief Platform-agnostic interface for one row-sense line of a key matrix
 *
 * The line is an input biased high by a pull-up. A closed switch connects it
 * to a driven column, pulling it low.
 */
class RowLine {
public:
    virtual ~RowLine() = default;

    /**
     * @brief Sample the line
     * @return true if the line reads electrically low (a key on this row is closed
     *         against the currently driven column)
     */
    virtual bool isAsserted() const = 0;
};

/**
 * @brief Platform-agnostic interface for one column-drive line of a key matrix
 *
 * The line behaves as an open-drain output: it either sinks current (driven low)
 * or floats at high impedance (released).
 */
class ColumnLine {
public:
    virtual ~ColumnLine() = default;

    /**
     * @brief Actively drive the column low, selecting it for row sampling
     */
    virtual void driveLow() = 0;

    /**
     * @brief Return the column to its idle, high-impedance state
     * @return false if the line may still be driven low
     */
    virtual bool release() = 0;
};

/**
 * @brief Blocking delay provider used to let the matrix settle
 *
 * Implementations block the calling context for approximately the requested
 * time. Embedded targets typically busy-wait for short delays.
 */
class DelaySource {
public:
    virtual ~DelaySource() = default;

    /**
     * @brief Block the caller
     * @param us Requested delay in microseconds
     */
    virtual void delayMicroseconds(uint32_t us) = 0;
};

} // namespace keypad
