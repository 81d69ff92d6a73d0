#include <algorithm>

#include "rl_backend.h"
#include "rl_constants.h"

std::optional<PassPlan> resolvePassPlan(const MatchSides& sides, const std::string& name,
                                        const std::string& artifactName,
                                        const std::vector<std::string>& logicalVars, bool inverted,
                                        std::vector<std::string>& missing) {
    if (logicalVars.empty()) return std::nullopt;

    PassPlan plan;
    plan.name = name;
    plan.artifactName = artifactName;
    plan.dedup = sides.dedup;

    const std::size_t missingBefore = missing.size();
    auto resolveBoth = [&](const std::string& logical, std::string& columnA, std::string& columnB) {
        auto a = resolveField(sides.fieldsA, sides.recordsA, logical);
        auto b = resolveField(sides.fieldsB, sides.recordsB, logical);
        if (!a || !b) {
            missing.push_back(logical);
            return;
        }
        columnA = *a;
        columnB = *b;
    };

    resolveBoth(IDENTIFIER_FIELD, plan.idColumnA, plan.idColumnB);
    for (const auto& logical : logicalVars) {
        std::string columnA, columnB;
        resolveBoth(logical, columnA, columnB);
        plan.keys.columnsA.push_back(std::move(columnA));
        plan.keys.columnsB.push_back(std::move(columnB));
    }

    if (missing.size() != missingBefore) return std::nullopt;

    // Inverted passes pair the variables crosswise (first/last against last/first)
    if (inverted) {
        std::reverse(plan.keys.columnsB.begin(), plan.keys.columnsB.end());
    }
    return plan;
}

Predicate candidatePredicate(const PassPlan& plan, const ExclusionState& exclusion) {
    std::vector<Predicate> terms;
    terms.push_back(plan.keys.joinPredicate());
    if (!exclusion.excludesNothing()) {
        terms.push_back(Predicate::negate(exclusion.predicate()));
    }
    if (plan.dedup) {
        terms.push_back(Predicate::ordinalLess());
        terms.push_back(Predicate::identifiersDiffer(plan.idColumnA, plan.idColumnB));
    }
    return Predicate::allOf(std::move(terms));
}
