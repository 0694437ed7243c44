#include "reconciler.hpp"
#include "normalizer.hpp"

namespace inventory {

NameIndex::NameIndex(const std::vector<CanonicalRecord> &reference)
    : reference_(reference) {
    index_.reserve(reference.size());
    for (std::size_t i = 0; i < reference.size(); ++i) {
        std::string key = normalize_name(reference[i].workstationName);
        if (key.empty()) continue;
        if (!index_.emplace(std::move(key), i).second) ++collisions_;
    }
}

const CanonicalRecord *NameIndex::find(const std::string &name) const {
    const std::string key = normalize_name(name);
    if (key.empty()) return nullptr;
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &reference_[it->second];
}

Reconciliation reconcile(const std::vector<CanonicalRecord> &reference,
                         const std::vector<RosterEntry> &roster) {
    const NameIndex index(reference);

    Reconciliation out;
    out.ambiguousKeys = index.collisions();
    for (const auto &entry : roster) {
        if (const CanonicalRecord *hit = index.find(entry.pcName))
            out.matched.push_back(*hit);
        else
            out.unmatched.push_back(entry);
    }
    return out;
}

}
