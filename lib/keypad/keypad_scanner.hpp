#pragma once

#include <matrix_lines.hpp>
#include <keypad_layout.hpp>
#include <scanner_config.hpp>
#include <log.hpp>
#include <array>
#include <memory>
#include <stdexcept>
#include <utility>
#include <cstdint>

namespace keypad {

/**
 * @brief Column-by-column scanner for a passive switch matrix
 *
 * Each pass drives one column low at a time, waits for the lines to settle,
 * then samples every row. The first asserted row reported, in ascending column
 * then ascending row order, wins. Holding several keys therefore yields the one
 * with the lowest column index (then lowest row index).
 *
 * The scanner keeps no state between passes and does not debounce. A key
 * bouncing during a pass may be reported once or not at all; callers that need
 * stable readings filter successive results (see StableKeyFilter).
 *
 * @tparam Rows Number of row lines (>= 1)
 * @tparam Cols Number of column lines (>= 1)
 */
template<uint8_t Rows, uint8_t Cols>
class KeypadScanner {
public:
    using Layout = KeypadLayout<Rows, Cols>;
    using RowLines = std::array<std::unique_ptr<RowLine>, Rows>;
    using ColumnLines = std::array<std::unique_ptr<ColumnLine>, Cols>;

    /**
     * @brief Take ownership of the matrix lines
     * @param rows Row lines in row-index order
     * @param columns Column lines in column-index order
     * @param layout Character for each (row, column)
     * @param config Timing parameters
     * @throws std::invalid_argument if a line is missing, the layout is ambiguous
     *         or the settle time is zero
     */
    KeypadScanner(RowLines rows,
                  ColumnLines columns,
                  const Layout& layout,
                  ScannerConfig config = ScannerConfig())
        : rows_(std::move(rows))
        , columns_(std::move(columns))
        , layout_(layout)
        , config_(config) {

        for (uint8_t r = 0; r < Rows; r++) {
            if (!rows_[r]) {
                logError("Keypad row %d has no line", r);
                throw std::invalid_argument("Keypad row line missing");
            }
        }
        for (uint8_t c = 0; c < Cols; c++) {
            if (!columns_[c]) {
                logError("Keypad column %d has no line", c);
                throw std::invalid_argument("Keypad column line missing");
            }
        }
        if (!layout_.isValid()) {
            throw std::invalid_argument("Keypad layout has ambiguous keys");
        }
        if (config_.settleTimeUs == 0) {
            logError("Keypad settle time must be greater than zero");
            throw std::invalid_argument("Keypad settle time must be greater than zero");
        }

        // Start from a known idle matrix
        for (uint8_t c = 0; c < Cols; c++) {
            if (!columns_[c]->release()) {
                logError("Keypad column %d could not be released", c);
                throw std::runtime_error("Keypad column line cannot be released");
            }
        }

        logInfo("Keypad scanner ready: %d rows x %d columns, settle %lu us",
                Rows, Cols, static_cast<unsigned long>(config_.settleTimeUs));
    }

    KeypadScanner(const KeypadScanner&) = delete;
    KeypadScanner& operator=(const KeypadScanner&) = delete;

    /**
     * @brief Perform one pass over the matrix
     * @param delay Used to wait for the lines to settle after each column drive
     * @return Character of the first closed key found, or NO_KEY
     * @note Blocks for up to Cols settle times. Never allocates.
     *
     * A column that fails to release ends the pass with NO_KEY, so no further
     * column is driven while it may still be low. The line reports the failure.
     */
    char scan(DelaySource& delay) {
        for (uint8_t c = 0; c < Cols; c++) {
            ColumnLine& column = *columns_[c];
            column.driveLow();
            delay.delayMicroseconds(config_.settleTimeUs);

            char key = NO_KEY;
            for (uint8_t r = 0; r < Rows; r++) {
                if (rows_[r]->isAsserted()) {
                    key = layout_.at(r, c);
                    break;
                }
            }

            if (!column.release()) {
                return NO_KEY;
            }
            if (key != NO_KEY) {
                return key;
            }
        }
        return NO_KEY;
    }

    /**
     * @brief Wait for a key press
     * @param delay Delay source for settling and for the poll interval
     * @return Character of the first key found
     * @note No timeout. Blocks until a key is held during a pass.
     */
    char readChar(DelaySource& delay) {
        char key = scan(delay);
        while (key == NO_KEY) {
            if (config_.pollIntervalUs > 0) {
                delay.delayMicroseconds(config_.pollIntervalUs);
            }
            key = scan(delay);
        }
        return key;
    }

    uint8_t rowCount() const { return Rows; }
    uint8_t columnCount() const { return Cols; }
    const Layout& layout() const { return layout_; }
    const ScannerConfig& config() const { return config_; }

private:
    RowLines rows_;
    ColumnLines columns_;
    const Layout layout_;
    const ScannerConfig config_;
};

using PhoneKeypadScanner = KeypadScanner<4, 3>;

} // namespace keypad
