#include "card_generator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iterator>
#include <numeric>
#include <sstream>
#include <vector>

namespace bingo {

using RowCounts = std::array<int, kRows>;

static std::atomic<uint64_t> g_generators_created{0};

static uint32_t lo32(uint64_t v) { return static_cast<uint32_t>(v); }
static uint32_t hi32(uint64_t v) { return static_cast<uint32_t>(v >> 32); }

static int bits_set(int mask) {
    int n = 0;
    for (int r = 0; r < kRows; r++) n += (mask >> r) & 1;
    return n;
}

// Gale-Ryser for a 0/1 matrix with kRows rows: the remaining row capacities
// can be met by the columns order[from..] iff the totals match and, for every
// k, the k largest capacities fit into sum(min(count, k)) over those columns.
static bool rows_feasible(RowCounts left, const ColumnCounts& counts,
                          const std::array<int, kCols>& order, int from) {
    int need = 0;
    for (int r = 0; r < kRows; r++) {
        if (left[r] < 0) return false;
        need += left[r];
    }
    int have = 0;
    for (int i = from; i < kCols; i++) have += counts[order[i]];
    if (need != have) return false;

    std::sort(left.begin(), left.end(), [](int a, int b) { return a > b; });
    int prefix = 0;
    for (int k = 1; k <= kRows; k++) {
        prefix += left[k - 1];
        int cap = 0;
        for (int i = from; i < kCols; i++) cap += std::min(counts[order[i]], k);
        if (prefix > cap) return false;
    }
    return true;
}

CardGenerator::CardGenerator() {
    // Mix clock + random_device + a counter to avoid identical streams on fast repeats.
    std::random_device rd;
    const auto now = static_cast<uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const uint64_t n = g_generators_created.fetch_add(1);
    std::seed_seq seq{static_cast<uint32_t>(rd()), static_cast<uint32_t>(rd()),
                      static_cast<uint32_t>(rd()), lo32(now), hi32(now),
                      lo32(n), lo32(now) ^ 0x9e3779b9U};
    rng_.seed(seq);
}

CardGenerator::CardGenerator(uint64_t seed, uint64_t stream) {
    std::seed_seq seq{lo32(seed), hi32(seed), lo32(stream), hi32(stream)};
    rng_.seed(seq);
}

std::string CardGenerator::column_distribution(ColumnCounts& counts) {
    counts.fill(1);
    int remaining = kNumbersPerCard - kCols;

    std::vector<int> eligible;
    eligible.reserve(kCols);
    while (remaining > 0) {
        eligible.clear();
        for (int col = 0; col < kCols; col++) {
            if (counts[col] < kMaxPerColumn) eligible.push_back(col);
        }
        if (eligible.empty()) return "column distribution ran out of eligible columns";

        std::uniform_int_distribution<size_t> pick(0, eligible.size() - 1);
        counts[eligible[pick(rng_)]]++;
        remaining--;
    }
    return "";
}

std::string CardGenerator::row_assignment(const ColumnCounts& counts, Grid& marks) {
    for (auto& row : marks) row.fill(kEmpty);

    int total = 0;
    for (int col = 0; col < kCols; col++) {
        if (counts[col] < 1 || counts[col] > kRows) {
            std::ostringstream ss;
            ss << "column " << col << " count " << counts[col] << " outside 1.." << kRows;
            return ss.str();
        }
        total += counts[col];
    }
    if (total != kNumbersPerRow * kRows) {
        std::ostringstream ss;
        ss << "column counts sum to " << total << ", expected " << kNumbersPerRow * kRows;
        return ss.str();
    }

    std::array<int, kCols> order;
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng_);

    RowCounts left;
    left.fill(kNumbersPerRow);

    std::vector<int> options;
    for (int i = 0; i < kCols; i++) {
        const int col = order[i];
        options.clear();
        for (int mask = 1; mask < (1 << kRows); mask++) {
            if (bits_set(mask) != counts[col]) continue;
            RowCounts next = left;
            for (int r = 0; r < kRows; r++) {
                if ((mask >> r) & 1) next[r]--;
            }
            if (rows_feasible(next, counts, order, i + 1)) options.push_back(mask);
        }
        if (options.empty()) {
            std::ostringstream ss;
            ss << "no feasible row subset for column " << col;
            return ss.str();
        }

        std::uniform_int_distribution<size_t> pick(0, options.size() - 1);
        const int mask = options[pick(rng_)];
        for (int r = 0; r < kRows; r++) {
            if ((mask >> r) & 1) {
                marks[r][col] = 1;
                left[r]--;
            }
        }
    }
    return "";
}

void CardGenerator::fill_numbers(const Grid& marks, Grid& out) {
    std::vector<int> pool;
    std::vector<int> picked;
    for (int col = 0; col < kCols; col++) {
        size_t need = 0;
        for (int row = 0; row < kRows; row++) {
            out[row][col] = kEmpty;
            if (marks[row][col] != kEmpty) need++;
        }

        const ColumnRange range = column_range(col);
        pool.resize(static_cast<size_t>(range.size()));
        std::iota(pool.begin(), pool.end(), range.lo);
        picked.clear();
        std::sample(pool.begin(), pool.end(), std::back_inserter(picked), need, rng_);
        std::sort(picked.begin(), picked.end());

        size_t next = 0;
        for (int row = 0; row < kRows && next < picked.size(); row++) {
            if (marks[row][col] != kEmpty) out[row][col] = static_cast<Cell>(picked[next++]);
        }
    }
}

std::string CardGenerator::generate_one(Card& out) {
    std::string last_err;
    for (int restart = 0; restart < kMaxRestarts; restart++) {
        stats_.attempts++;

        ColumnCounts counts;
        auto err = column_distribution(counts);
        if (!err.empty()) {
            last_err = err;
            continue;
        }

        Grid marks{};
        for (int local = 0; local < kMaxLocalAttempts; local++) {
            err = row_assignment(counts, marks);
            if (err.empty()) break;
        }
        if (!err.empty()) {
            last_err = err;
            continue;
        }

        Grid grid{};
        fill_numbers(marks, grid);
        Card card(grid);

        // Safety net; the construction above should already satisfy every rule.
        err = validate(card);
        if (!err.empty()) {
            stats_.rejected_invalid++;
            last_err = err;
            continue;
        }

        stats_.accepted++;
        out = card;
        return "";
    }

    std::ostringstream ss;
    ss << "card generation failed after " << kMaxRestarts << " restarts: " << last_err;
    return ss.str();
}

}  // namespace bingo
