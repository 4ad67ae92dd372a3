#pragma once

#include <cstddef>
#include <mutex>
#include <unordered_set>

#include "card.hpp"

namespace bingo {

// In-memory set of fingerprints of every card accepted this session.
// Safe to share between workers.
class CardRegistry {
public:
    // Atomic insert-if-absent. Returns true if `fp` was not seen before.
    bool insert(Fingerprint fp);

    bool contains(Fingerprint fp) const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex mtx_;
    std::unordered_set<Fingerprint> seen_;
};

}  // namespace bingo
