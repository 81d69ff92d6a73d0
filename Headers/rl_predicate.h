#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "rl_constants.h"
#include "rl_records.h"

// Join condition between a record of side A and a record of side B, built as a
// node tree and rendered per backend. Column names are only ever emitted as
// quoted identifiers.
class Predicate {
public:
    enum class Kind {
        Equal,              // a.x = b.y, both non-empty and non-null
        OrdinalLess,        // a.idx < b.idx
        IdentifiersDiffer,  // a.id <> b.id
        AllOf,              // conjunction, TRUE when empty
        AnyOf,              // disjunction, FALSE when empty
        Not
    };

    static Predicate equal(std::string columnA, std::string columnB);
    static Predicate ordinalLess();
    static Predicate identifiersDiffer(std::string columnA, std::string columnB);
    static Predicate allOf(std::vector<Predicate> terms);
    static Predicate anyOf(std::vector<Predicate> terms);
    static Predicate negate(Predicate term);

    Kind kind() const { return kind_; }
    const std::vector<Predicate>& terms() const { return terms_; }

    // Render as an SQL boolean expression over the two table aliases
    std::string toSql(const std::string& aliasA, const std::string& aliasB) const;

    // Evaluate against record ordinalA of side a and record ordinalB of side b
    bool evaluate(const RecordSet& a, std::size_t ordinalA, const RecordSet& b, std::size_t ordinalB) const;

private:
    explicit Predicate(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::string columnA_;
    std::string columnB_;
    std::vector<Predicate> terms_;
};
