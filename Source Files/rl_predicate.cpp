#include <stdexcept>

#include "database.h"
#include "rl_predicate.h"

namespace {

    std::string qualified(const std::string& alias, const std::string& column) {
        return alias + "." + quoteIdentifier(column);
    }

    const std::string& lookup(const RecordSet& records, std::size_t ordinal, const std::string& column) {
        auto index = records.columnIndex(column);
        if (!index) {
            throw std::out_of_range("Column '" + column + "' not found in dataset " + records.name());
        }
        return records.value(ordinal, *index);
    }

    std::string joinTerms(const std::vector<Predicate>& terms, const std::string& op,
                          const std::string& aliasA, const std::string& aliasB) {
        std::string sql = "(";
        for (std::size_t i = 0; i < terms.size(); ++i) {
            if (i > 0) sql += " " + op + " ";
            sql += terms[i].toSql(aliasA, aliasB);
        }
        sql += ")";
        return sql;
    }

}

Predicate Predicate::equal(std::string columnA, std::string columnB) {
    Predicate p(Kind::Equal);
    p.columnA_ = std::move(columnA);
    p.columnB_ = std::move(columnB);
    return p;
}

Predicate Predicate::ordinalLess() {
    Predicate p(Kind::OrdinalLess);
    p.columnA_ = ORDINAL_COLUMN;
    p.columnB_ = ORDINAL_COLUMN;
    return p;
}

Predicate Predicate::identifiersDiffer(std::string columnA, std::string columnB) {
    Predicate p(Kind::IdentifiersDiffer);
    p.columnA_ = std::move(columnA);
    p.columnB_ = std::move(columnB);
    return p;
}

Predicate Predicate::allOf(std::vector<Predicate> terms) {
    Predicate p(Kind::AllOf);
    p.terms_ = std::move(terms);
    return p;
}

Predicate Predicate::anyOf(std::vector<Predicate> terms) {
    Predicate p(Kind::AnyOf);
    p.terms_ = std::move(terms);
    return p;
}

Predicate Predicate::negate(Predicate term) {
    Predicate p(Kind::Not);
    p.terms_.push_back(std::move(term));
    return p;
}

std::string Predicate::toSql(const std::string& aliasA, const std::string& aliasB) const {
    switch (kind_) {
    case Kind::Equal: {
        const std::string a = qualified(aliasA, columnA_);
        const std::string b = qualified(aliasB, columnB_);
        // Both IS NOT NULL guards keep the term two-valued under NOT
        return "(" + a + " = " + b + " AND " + a + " <> '' AND " +
               a + " IS NOT NULL AND " + b + " IS NOT NULL)";
    }
    case Kind::OrdinalLess:
        return qualified(aliasA, columnA_) + " < " + qualified(aliasB, columnB_);
    case Kind::IdentifiersDiffer:
        return qualified(aliasA, columnA_) + " <> " + qualified(aliasB, columnB_);
    case Kind::AllOf:
        return terms_.empty() ? "1" : joinTerms(terms_, "AND", aliasA, aliasB);
    case Kind::AnyOf:
        return terms_.empty() ? "0" : joinTerms(terms_, "OR", aliasA, aliasB);
    case Kind::Not:
        return "NOT (" + terms_.front().toSql(aliasA, aliasB) + ")";
    }
    throw std::logic_error("Unknown predicate kind");
}

bool Predicate::evaluate(const RecordSet& a, std::size_t ordinalA, const RecordSet& b, std::size_t ordinalB) const {
    switch (kind_) {
    case Kind::Equal: {
        const std::string& valueA = lookup(a, ordinalA, columnA_);
        return !valueA.empty() && valueA == lookup(b, ordinalB, columnB_);
    }
    case Kind::OrdinalLess:
        return ordinalA < ordinalB;
    case Kind::IdentifiersDiffer:
        return lookup(a, ordinalA, columnA_) != lookup(b, ordinalB, columnB_);
    case Kind::AllOf:
        for (const auto& term : terms_) {
            if (!term.evaluate(a, ordinalA, b, ordinalB)) return false;
        }
        return true;
    case Kind::AnyOf:
        for (const auto& term : terms_) {
            if (term.evaluate(a, ordinalA, b, ordinalB)) return true;
        }
        return false;
    case Kind::Not:
        return !terms_.front().evaluate(a, ordinalA, b, ordinalB);
    }
    throw std::logic_error("Unknown predicate kind");
}
