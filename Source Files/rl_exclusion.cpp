#include "rl_exclusion.h"

Predicate BlockingKeys::joinPredicate() const {
    std::vector<Predicate> terms;
    terms.reserve(columnsA.size());
    for (std::size_t i = 0; i < columnsA.size(); ++i) {
        terms.push_back(Predicate::equal(columnsA[i], columnsB[i]));
    }
    return Predicate::allOf(std::move(terms));
}

ExclusionState ExclusionState::commit(BlockingKeys keys) const {
    ExclusionState next = *this;
    next.priorBlocks_.push_back(std::move(keys));
    ++next.version_;
    return next;
}

Predicate ExclusionState::predicate() const {
    std::vector<Predicate> terms;
    terms.reserve(priorBlocks_.size());
    for (const auto& keys : priorBlocks_) {
        terms.push_back(keys.joinPredicate());
    }
    return Predicate::anyOf(std::move(terms));
}
