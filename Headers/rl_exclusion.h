#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "rl_predicate.h"

// Blocking-variable columns of one pass, side A and side B in matching order
struct BlockingKeys {
    std::vector<std::string> columnsA;
    std::vector<std::string> columnsB;

    bool empty() const { return columnsA.empty(); }

    // Conjunction of guarded equalities columnsA[i] = columnsB[i]
    Predicate joinPredicate() const;
};

// Cumulative record of what earlier passes already blocked on. Values are
// immutable: commit() returns the next version and leaves this one untouched.
class ExclusionState {
public:
    ExclusionState() = default;

    ExclusionState commit(BlockingKeys keys) const;

    const std::vector<BlockingKeys>& priorBlocks() const { return priorBlocks_; }
    std::size_t version() const { return version_; }
    bool excludesNothing() const { return priorBlocks_.empty(); }

    // Disjunction of every committed pass' join predicate
    Predicate predicate() const;

private:
    std::vector<BlockingKeys> priorBlocks_;
    std::size_t version_ = 0;
};
