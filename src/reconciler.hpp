#pragma once
#include "models.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace inventory {

// Normalized-name lookup over a reference table. Built once, read-only
// afterwards. When several records share a key the first one wins.
// The reference vector must outlive the index.
class NameIndex {
public:
    explicit NameIndex(const std::vector<CanonicalRecord> &reference);
    NameIndex(std::vector<CanonicalRecord> &&) = delete;

    // nullptr when the key is empty or unknown.
    const CanonicalRecord *find(const std::string &name) const;

    std::size_t size() const { return index_.size(); }
    std::size_t collisions() const { return collisions_; }

private:
    const std::vector<CanonicalRecord> &reference_;
    std::unordered_map<std::string, std::size_t> index_;
    std::size_t collisions_ = 0;
};

// Splits the roster into reference rows that were found and roster entries
// that were not. Every roster entry lands in exactly one of the two lists.
Reconciliation reconcile(const std::vector<CanonicalRecord> &reference,
                         const std::vector<RosterEntry> &roster);

}
