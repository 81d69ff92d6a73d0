#pragma once
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Map from logical field name to the concrete column name of one dataset
using FieldMap = std::map<std::string, std::string>;

// Ordered records of one dataset; the ordinal index of a record is its position
class RecordSet {
public:
    RecordSet() = default;
    RecordSet(std::string name, std::vector<std::string> columns);

    const std::string& name() const { return name_; }
    const std::vector<std::string>& columns() const { return columns_; }
    std::size_t size() const { return rows_.size(); }

    std::optional<std::size_t> columnIndex(const std::string& column) const;
    bool hasColumn(const std::string& column) const { return columnIndex(column).has_value(); }

    // Append a record; short rows are padded with empty values
    void addRecord(std::vector<std::string> values);

    const std::string& value(std::size_t ordinal, std::size_t column) const { return rows_[ordinal][column]; }

private:
    std::string name_;
    std::vector<std::string> columns_;
    std::unordered_map<std::string, std::size_t> columnLookup_;
    std::vector<std::vector<std::string>> rows_;
};

// Load a preprocessed dataset from a CSV file with a header row
RecordSet loadRecordSet(const std::filesystem::path& path, const std::string& name);

// Resolve a logical field to its column; empty if unmapped, the column is missing
// or the column is the reserved ordinal column
std::optional<std::string> resolveField(const FieldMap& fields, const RecordSet& records, const std::string& logical);
