#pragma once

#include <string>

#include "card.hpp"
#include "card_manager.hpp"

namespace bingo_test {

// A hand-built card that satisfies every structural rule.
// Column counts: 2,2,2,2,2,2,1,1,1.
inline bingo::Grid sample_grid() {
    return bingo::Grid{{
        {{1, 10, 0, 31, 40, 0, 60, 0, 0}},
        {{5, 0, 22, 33, 0, 51, 0, 77, 0}},
        {{0, 19, 28, 0, 49, 57, 0, 0, 90}},
    }};
}

inline bingo::Card sample_card() { return bingo::Card(sample_grid()); }

// A source that proposes the same card forever.
inline bingo::CardManager::SourceFactory constant_source(const bingo::Card& card) {
    return [card](int) {
        return bingo::CardManager::CardSource([card](bingo::Card& out) {
            out = card;
            return std::string();
        });
    };
}

}  // namespace bingo_test
