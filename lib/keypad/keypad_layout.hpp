#pragma once

#include <log.hpp>
#include <array>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace keypad {

/// Scan result meaning "no key pressed"
constexpr char NO_KEY = ' ';

/**
 * @brief Immutable mapping from matrix coordinates to key characters
 *
 * Dimensions are template parameters so that a scanner can only be paired
 * with a layout of exactly its own geometry.
 *
 * Build from a named Table. A one-row brace literal passed straight to the
 * constructor is ambiguous with the copy constructor:
 * @code
 * const KeypadLayout<1, 3>::Table keys = {{ {{'<', 'O', '>'}} }};
 * const KeypadLayout<1, 3> layout(keys);
 * @endcode
 *
 * @tparam Rows Number of row lines
 * @tparam Cols Number of column lines
 */
template<uint8_t Rows, uint8_t Cols>
class KeypadLayout {
    static_assert(Rows > 0, "A keypad needs at least one row");
    static_assert(Cols > 0, "A keypad needs at least one column");

public:
    using Table = std::array<std::array<char, Cols>, Rows>;

    explicit KeypadLayout(const Table& keys) : keys_(keys) {}

    char at(uint8_t row, uint8_t col) const {
        return keys_[row][col];
    }

    const Table& keys() const { return keys_; }

    /**
     * @brief Check that every key is distinguishable
     * @return false if two coordinates share a character or a coordinate maps to NO_KEY
     */
    bool isValid() const {
        for (size_t i = 0; i < Rows * Cols; i++) {
            char key = keys_[i / Cols][i % Cols];
            if (key == NO_KEY) {
                logError("Layout entry (%u, %u) uses the no-key character",
                         static_cast<unsigned>(i / Cols), static_cast<unsigned>(i % Cols));
                return false;
            }
            for (size_t j = i + 1; j < Rows * Cols; j++) {
                if (keys_[j / Cols][j % Cols] == key) {
                    logError("Layout character '%c' appears at (%u, %u) and (%u, %u)", key,
                             static_cast<unsigned>(i / Cols), static_cast<unsigned>(i % Cols),
                             static_cast<unsigned>(j / Cols), static_cast<unsigned>(j % Cols));
                    return false;
                }
            }
        }
        return true;
    }

    /**
     * @brief Build a layout from one string per row
     * @param rows Row strings, each exactly Cols characters long
     * @param layout Receives the result on success, untouched otherwise
     * @return true if the dimensions matched
     */
    static bool fromStrings(const std::vector<std::string>& rows, KeypadLayout& layout) {
        if (rows.size() != Rows) {
            logError("Layout has %zu rows, keypad has %u", rows.size(), static_cast<unsigned>(Rows));
            return false;
        }

        Table keys;
        for (uint8_t r = 0; r < Rows; r++) {
            if (rows[r].size() != Cols) {
                logError("Layout row %u has %zu keys, keypad has %u columns",
                         static_cast<unsigned>(r), rows[r].size(), static_cast<unsigned>(Cols));
                return false;
            }
            for (uint8_t c = 0; c < Cols; c++) {
                keys[r][c] = rows[r][c];
            }
        }

        layout = KeypadLayout(keys);
        return true;
    }

private:
    Table keys_;
};

using PhoneLayout = KeypadLayout<4, 3>;

/// Standard 4x3 telephone keypad
const PhoneLayout PHONE_LAYOUT({{
    {{'1', '2', '3'}},
    {{'4', '5', '6'}},
    {{'7', '8', '9'}},
    {{'*', '0', '#'}}
}});

} // namespace keypad
