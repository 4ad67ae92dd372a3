#include "card_manager.hpp"

#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

namespace bingo {

static std::string check_args(int total, int batch_size) {
    if (total < 0) return "total must be >= 0";
    if (batch_size <= 0) return "batch size must be >= 1";
    return "";
}

static std::string invalid_error() {
    std::ostringstream ss;
    ss << "card source produced more than " << CardGenerator::kMaxRestarts
       << " invalid cards in a row";
    return ss.str();
}

CardManager::CardManager()
    : CardManager([](int) {
          auto gen = std::make_shared<CardGenerator>();
          return CardSource([gen](Card& out) { return gen->generate_one(out); });
      }) {}

CardManager::CardManager(uint64_t seed)
    : CardManager([seed](int worker) {
          auto gen = std::make_shared<CardGenerator>(seed, static_cast<uint64_t>(worker));
          return CardSource([gen](Card& out) { return gen->generate_one(out); });
      }) {}

CardManager::CardManager(SourceFactory factory, int max_consecutive_duplicates)
    : factory_(std::move(factory)), max_consecutive_duplicates_(max_consecutive_duplicates) {}

CardManager::CardSource& CardManager::source(int worker) {
    while (sources_.size() <= static_cast<size_t>(worker)) {
        sources_.push_back(factory_(static_cast<int>(sources_.size())));
    }
    return sources_[static_cast<size_t>(worker)];
}

std::string CardManager::exhausted_error(size_t have, int total) const {
    std::ostringstream ss;
    ss << "card space exhausted: " << max_consecutive_duplicates_
       << " duplicates in a row after " << have << "/" << total << " cards ("
       << registry_.size() << " issued this session)";
    return ss.str();
}

void CardManager::log_progress(size_t have, int total, int batch_size) const {
    if (total <= batch_size) return;
    if (have % static_cast<size_t>(batch_size) != 0 && have != static_cast<size_t>(total)) return;
    std::cerr << "Prepared " << have << "/" << total << " cards (" << registry_.size()
              << " unique this session)\n";
}

std::string CardManager::prepare(int total, int batch_size) {
    auto err = check_args(total, batch_size);
    if (!err.empty()) return err;

    cards_.clear();
    cards_.reserve(static_cast<size_t>(total));
    CardSource& next = source(0);

    int duplicates = 0;
    int invalid = 0;
    while (cards_.size() < static_cast<size_t>(total)) {
        Card card;
        attempts_++;
        err = next(card);
        if (!err.empty()) return "card generation failed: " + err;

        if (!validate(card).empty()) {
            rejected_invalid_++;
            if (++invalid > CardGenerator::kMaxRestarts) return invalid_error();
            continue;
        }
        invalid = 0;

        if (!registry_.insert(fingerprint(card))) {
            rejected_duplicate_++;
            if (++duplicates >= max_consecutive_duplicates_) {
                return exhausted_error(cards_.size(), total);
            }
            continue;
        }
        duplicates = 0;

        cards_.push_back(card);
        accepted_++;
        log_progress(cards_.size(), total, batch_size);
    }
    return "";
}

std::string CardManager::prepare_parallel(int total, int workers, int batch_size) {
    if (workers > kMaxWorkers) {
        std::ostringstream ss;
        ss << "workers must be <= " << kMaxWorkers << ", got " << workers;
        return ss.str();
    }
    if (workers <= 1) return prepare(total, batch_size);

    auto err = check_args(total, batch_size);
    if (!err.empty()) return err;

    cards_.clear();
    if (total == 0) return "";
    cards_.reserve(static_cast<size_t>(total));

    // Create every source up front; sources_ must not grow once threads run.
    for (int w = 0; w < workers; w++) source(w);

    std::mutex mtx;
    std::atomic<bool> done{false};
    int duplicates = 0;       // guarded by mtx
    std::string first_error;  // guarded by mtx

    auto fail = [&](std::string e) {
        if (first_error.empty()) first_error = std::move(e);
        done.store(true);
    };

    auto work = [&](int w) {
        CardSource& next = sources_[static_cast<size_t>(w)];
        int invalid = 0;
        while (!done.load(std::memory_order_relaxed)) {
            Card card;
            attempts_++;
            auto gen_err = next(card);
            if (!gen_err.empty()) {
                std::lock_guard<std::mutex> lock(mtx);
                fail("card generation failed: " + gen_err);
                return;
            }

            if (!validate(card).empty()) {
                rejected_invalid_++;
                if (++invalid > CardGenerator::kMaxRestarts) {
                    std::lock_guard<std::mutex> lock(mtx);
                    fail(invalid_error());
                    return;
                }
                continue;
            }
            invalid = 0;

            const Fingerprint fp = fingerprint(card);

            // Check-and-insert plus append form one critical section, so two
            // workers can never both accept the same card.
            std::lock_guard<std::mutex> lock(mtx);
            if (done.load()) return;
            if (!registry_.insert(fp)) {
                rejected_duplicate_++;
                if (++duplicates >= max_consecutive_duplicates_) {
                    fail(exhausted_error(cards_.size(), total));
                }
                continue;
            }
            duplicates = 0;

            cards_.push_back(card);
            accepted_++;
            log_progress(cards_.size(), total, batch_size);
            if (cards_.size() >= static_cast<size_t>(total)) done.store(true);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(workers));
    try {
        for (int w = 0; w < workers; w++) threads.emplace_back(work, w);
    } catch (const std::system_error& e) {
        std::lock_guard<std::mutex> lock(mtx);
        fail(std::string("could not start worker thread: ") + e.what());
    }
    for (auto& thread : threads) thread.join();

    return first_error;
}

const Card& CardManager::get(int index) const {
    if (index < 0 || static_cast<size_t>(index) >= cards_.size()) {
        std::ostringstream ss;
        ss << "card index " << index << " out of range (have " << cards_.size() << " cards)";
        throw std::out_of_range(ss.str());
    }
    return cards_[static_cast<size_t>(index)];
}

bool CardManager::validate_unique(const std::vector<Card>& cards) {
    // Equal fingerprints are confirmed against the grids, so a hash collision
    // between distinct cards is not reported as a duplicate.
    std::unordered_multimap<Fingerprint, size_t> seen;
    seen.reserve(cards.size());
    for (size_t i = 0; i < cards.size(); i++) {
        const Fingerprint fp = fingerprint(cards[i]);
        auto range = seen.equal_range(fp);
        for (auto it = range.first; it != range.second; ++it) {
            if (cards[it->second] == cards[i]) return false;
        }
        seen.emplace(fp, i);
    }
    return true;
}

GenerationStats CardManager::stats() const {
    GenerationStats s;
    s.attempts = attempts_.load();
    s.accepted = accepted_.load();
    s.rejected_duplicate = rejected_duplicate_.load();
    s.rejected_invalid = rejected_invalid_.load();
    return s;
}

void CardManager::reset() {
    registry_.clear();
    cards_.clear();
    attempts_ = 0;
    accepted_ = 0;
    rejected_duplicate_ = 0;
    rejected_invalid_ = 0;
    std::cerr << "Session reset\n";
}

}  // namespace bingo
