#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace bingo {

constexpr int kRows = 3;
constexpr int kCols = 9;
constexpr int kNumbersPerCard = 15;
constexpr int kNumbersPerRow = 5;
constexpr int kMaxPerColumn = 3;

using Cell = uint8_t;
constexpr Cell kEmpty = 0;  // no legal number is 0

using Grid = std::array<std::array<Cell, kCols>, kRows>;
using Fingerprint = uint64_t;

struct ColumnRange {
    int lo;
    int hi;  // inclusive
    int size() const { return hi - lo + 1; }
};

// Column 0 -> [1,9], columns 1..7 -> [10c, 10c+9], column 8 -> [80,90].
ColumnRange column_range(int col);

// Immutable 3x9 card. Built once from a grid; only read afterwards.
class Card {
public:
    Card() = default;
    explicit Card(const Grid& grid) : grid_(grid) {}

    Cell at(int row, int col) const;
    bool filled(int row, int col) const { return at(row, col) != kEmpty; }
    const Grid& grid() const { return grid_; }

    int row_count(int row) const;
    int column_count(int col) const;
    int filled_count() const;

    bool operator==(const Card& other) const { return grid_ == other.grid_; }
    bool operator!=(const Card& other) const { return !(*this == other); }

private:
    Grid grid_{};
};

// Returns empty string if the card satisfies every structural rule;
// otherwise a description of the first rule it breaks.
std::string validate(const Card& card);

// FNV-1a 64-bit over the row-major cell bytes (empty cells as kEmpty).
Fingerprint fingerprint(const Card& card);

// Number of structurally distinct cards, about 3.67e18. Computed in double
// precision, so the low digits are rounded.
double card_space_size();

std::ostream& operator<<(std::ostream& out, const Card& card);

}  // namespace bingo
