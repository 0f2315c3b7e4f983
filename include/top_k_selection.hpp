#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <set>
#include <vector>

#include "counter_store.hpp"
#include "errors.hpp"

/// \brief Orders counter entries by descending count, ties broken by ascending fingerprint.
struct ByRank {
    bool operator()(CounterEntry const& a, CounterEntry const& b) const {
        if(a.count != b.count) return a.count > b.count;
        return a.fingerprint < b.fingerprint;
    }
};

/// \brief Maintains the \c k best counter entries seen so far.
///
/// Once full, every insertion evicts the worst entry, so no entry outside the selection ranks better than the worst
/// one inside. The outcome depends only on the set of inserted entries, not on their order.
class TopKSelection {
private:
    size_t k_;
    std::set<CounterEntry, ByRank> best_;

public:
    explicit TopKSelection(int64_t const k) : k_(k > 0 ? size_t(k) : 0) {
    }

    size_t k() const { return k_; }
    size_t size() const { return best_.size(); }
    bool empty() const { return best_.empty(); }

    void insert(CounterEntry const& entry) {
        if(k_ == 0) return;

        if(best_.size() == k_) {
            // full, reject early if the entry cannot make it
            auto const& worst = *best_.rbegin();
            if(!ByRank()(entry, worst)) return;
        }

        best_.insert(entry);
        if(best_.size() > k_) {
            best_.erase(std::prev(best_.end()));
        }
    }

    std::vector<CounterEntry> result() const {
        return std::vector<CounterEntry>(best_.begin(), best_.end());
    }
};

/// \brief The reduce phase: selects the \c k highest-ranking counters from the store in a single pass.
///
/// If given, \c interrupted is polled once per visited counter; if it returns \c true, the pass stops with an \ref InterruptedError.
inline std::vector<CounterEntry> reduce(CounterStore const& store, int64_t const k, std::function<bool()> const& interrupted = {}) {
    TopKSelection top(k);
    if(top.k() > 0) {
        store.enumerate([&](CounterEntry const& entry){
            if(interrupted && interrupted()) throw InterruptedError("interrupted while selecting top phrases");
            top.insert(entry);
        });
    }
    return top.result();
}
