#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

#include "card.hpp"

namespace bingo {

struct GenerationStats {
    uint64_t attempts = 0;
    uint64_t accepted = 0;
    uint64_t rejected_duplicate = 0;
    uint64_t rejected_invalid = 0;
};

using ColumnCounts = std::array<int, kCols>;

// Builds one structurally valid card per call from its own random stream.
// Not thread-safe; give each worker its own generator.
class CardGenerator {
public:
    static constexpr int kMaxRestarts = 1000;
    static constexpr int kMaxLocalAttempts = 64;

    // Seeds once from random_device + high-resolution clock + a process-wide
    // counter, so generators created back to back never share a stream.
    CardGenerator();

    // Reproducible stream. Distinct `stream` values give independent sequences
    // for the same seed.
    explicit CardGenerator(uint64_t seed, uint64_t stream = 0);

    // Returns empty string on success; otherwise an error after kMaxRestarts.
    std::string generate_one(Card& out);

    GenerationStats stats() const { return stats_; }

    // The construction steps, exposed so they can be exercised on their own.

    // Every column starts at 1; the remaining 6 units go one at a time to a
    // uniformly chosen column that is still below kMaxPerColumn.
    std::string column_distribution(ColumnCounts& counts);

    // Marks which rows are filled in each column so that column sums equal
    // `counts` and every row gets kNumbersPerRow marks. Columns are visited in
    // random order; each picks uniformly among the row subsets that keep the
    // rest of the assignment feasible.
    std::string row_assignment(const ColumnCounts& counts, Grid& marks);

    // Replaces every non-zero mark with a number from the column's range,
    // ascending top to bottom.
    void fill_numbers(const Grid& marks, Grid& out);

private:
    std::mt19937 rng_;
    GenerationStats stats_;
};

}  // namespace bingo
