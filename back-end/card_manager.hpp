#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "card.hpp"
#include "card_generator.hpp"
#include "card_registry.hpp"

namespace bingo {

// Produces batches of pairwise-distinct cards for one session (event).
// Every card accepted during the session is unique against all others,
// across successive prepare() calls, until reset().
class CardManager {
public:
    static constexpr int kDefaultBatchSize = 1000;
    static constexpr int kMaxConsecutiveDuplicates = 100000;
    // Upper bound on prepare_parallel() workers, and so on live sources.
    static constexpr int kMaxWorkers = 64;

    // Proposes one candidate card. Returns empty string on success.
    using CardSource = std::function<std::string(Card&)>;
    // Creates the long-lived source for worker `worker` (0 for sequential use).
    using SourceFactory = std::function<CardSource(int worker)>;

    // Entropy-seeded generators, one per worker.
    CardManager();

    // Reproducible generators; worker i draws from stream i of `seed`.
    explicit CardManager(uint64_t seed);

    CardManager(SourceFactory factory, int max_consecutive_duplicates = kMaxConsecutiveDuplicates);

    CardManager(const CardManager&) = delete;
    CardManager& operator=(const CardManager&) = delete;

    // Replaces cards() with `total` new cards, none of which was issued
    // before in this session. Returns empty string on success; otherwise an
    // error message. Cards accepted before a failure stay in cards().
    std::string prepare(int total, int batch_size = kDefaultBatchSize);

    // Same contract as prepare(), with `workers` threads proposing candidates.
    // Fails without side effects when workers > kMaxWorkers.
    std::string prepare_parallel(int total, int workers, int batch_size = kDefaultBatchSize);

    const std::vector<Card>& cards() const { return cards_; }

    // Throws std::out_of_range if index is not in [0, cards().size()).
    const Card& get(int index) const;

    // True if no two cards in `cards` are identical. Independent of any registry.
    static bool validate_unique(const std::vector<Card>& cards);

    GenerationStats stats() const;

    // Number of worker sources created so far. Sources live as long as the
    // manager, so their streams continue across reset().
    size_t source_count() const { return sources_.size(); }

    // Number of unique cards handed out this session.
    size_t issued() const { return registry_.size(); }

    // Starts a new session: forgets every issued card and zeroes the counters.
    void reset();

private:
    CardSource& source(int worker);
    std::string exhausted_error(size_t have, int total) const;
    void log_progress(size_t have, int total, int batch_size) const;

    SourceFactory factory_;
    int max_consecutive_duplicates_;
    std::vector<CardSource> sources_;

    CardRegistry registry_;
    std::vector<Card> cards_;

    std::atomic<uint64_t> attempts_{0};
    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> rejected_duplicate_{0};
    std::atomic<uint64_t> rejected_invalid_{0};
};

}  // namespace bingo
