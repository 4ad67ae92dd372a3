#include "card.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace bingo {

ColumnRange column_range(int col) {
    if (col < 0 || col >= kCols) {
        std::ostringstream ss;
        ss << "column " << col << " out of range";
        throw std::out_of_range(ss.str());
    }
    if (col == 0) return {1, 9};
    if (col == kCols - 1) return {80, 90};
    return {col * 10, col * 10 + 9};
}

Cell Card::at(int row, int col) const {
    return grid_.at(static_cast<size_t>(row)).at(static_cast<size_t>(col));
}

int Card::row_count(int row) const {
    int n = 0;
    for (int col = 0; col < kCols; col++) n += filled(row, col) ? 1 : 0;
    return n;
}

int Card::column_count(int col) const {
    int n = 0;
    for (int row = 0; row < kRows; row++) n += filled(row, col) ? 1 : 0;
    return n;
}

int Card::filled_count() const {
    int n = 0;
    for (int row = 0; row < kRows; row++) n += row_count(row);
    return n;
}

std::string validate(const Card& card) {
    std::ostringstream ss;

    const int total = card.filled_count();
    if (total != kNumbersPerCard) {
        ss << "card has " << total << " numbers, expected " << kNumbersPerCard;
        return ss.str();
    }

    for (int row = 0; row < kRows; row++) {
        const int n = card.row_count(row);
        if (n != kNumbersPerRow) {
            ss << "row " << row << " has " << n << " numbers, expected " << kNumbersPerRow;
            return ss.str();
        }
    }

    for (int col = 0; col < kCols; col++) {
        const int n = card.column_count(col);
        if (n < 1 || n > kMaxPerColumn) {
            ss << "column " << col << " has " << n << " numbers, expected 1.." << kMaxPerColumn;
            return ss.str();
        }

        const ColumnRange range = column_range(col);
        int prev = 0;
        for (int row = 0; row < kRows; row++) {
            if (!card.filled(row, col)) continue;
            const int v = card.at(row, col);
            if (v < range.lo || v > range.hi) {
                ss << "column " << col << " holds " << v << ", outside [" << range.lo << ", "
                   << range.hi << "]";
                return ss.str();
            }
            if (v <= prev) {
                ss << "column " << col << " is not strictly ascending at row " << row;
                return ss.str();
            }
            prev = v;
        }
    }

    // Column ranges are disjoint and columns strictly ascend, so no number
    // can repeat once the checks above pass.
    return "";
}

Fingerprint fingerprint(const Card& card) {
    const uint64_t FNV_OFFSET = 1469598103934665603ULL;
    const uint64_t FNV_PRIME = 1099511628211ULL;
    uint64_t h = FNV_OFFSET;
    for (const auto& row : card.grid()) {
        for (Cell c : row) {
            h ^= static_cast<uint64_t>(c);
            h *= FNV_PRIME;
        }
    }
    return h;
}

static double binomial(int n, int k) {
    double r = 1.0;
    for (int i = 1; i <= k; i++) r = r * (n - k + i) / i;
    return r;
}

double card_space_size() {
    // State: filled cells per row so far, each in [0, kNumbersPerRow].
    constexpr int S = kNumbersPerRow + 1;
    auto index = [](int a, int b, int c) { return (a * S + b) * S + c; };

    std::vector<double> ways(S * S * S, 0.0);
    ways[index(0, 0, 0)] = 1.0;

    for (int col = 0; col < kCols; col++) {
        const int range = column_range(col).size();
        std::vector<double> next(ways.size(), 0.0);
        for (int a = 0; a < S; a++) {
            for (int b = 0; b < S; b++) {
                for (int c = 0; c < S; c++) {
                    const double w = ways[index(a, b, c)];
                    if (w == 0.0) continue;
                    // Every non-empty subset of rows is a legal column shape.
                    for (int mask = 1; mask < (1 << kRows); mask++) {
                        const int da = mask & 1, db = (mask >> 1) & 1, dc = (mask >> 2) & 1;
                        if (a + da >= S || b + db >= S || c + dc >= S) continue;
                        next[index(a + da, b + db, c + dc)] += w * binomial(range, da + db + dc);
                    }
                }
            }
        }
        ways.swap(next);
    }
    return ways[index(kNumbersPerRow, kNumbersPerRow, kNumbersPerRow)];
}

std::ostream& operator<<(std::ostream& out, const Card& card) {
    for (int row = 0; row < kRows; row++) {
        for (int col = 0; col < kCols; col++) {
            out << '|';
            if (card.filled(row, col)) {
                out << std::setw(2) << static_cast<int>(card.at(row, col));
            } else {
                out << "  ";
            }
        }
        out << "|\n";
    }
    return out;
}

}  // namespace bingo
