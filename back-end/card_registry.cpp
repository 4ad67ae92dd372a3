#include "card_registry.hpp"

namespace bingo {

bool CardRegistry::insert(Fingerprint fp) {
    std::lock_guard<std::mutex> lock(mtx_);
    return seen_.insert(fp).second;
}

bool CardRegistry::contains(Fingerprint fp) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return seen_.count(fp) != 0;
}

size_t CardRegistry::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return seen_.size();
}

void CardRegistry::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    seen_.clear();
}

}  // namespace bingo
