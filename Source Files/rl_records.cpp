#include <stdexcept>

#include "rl_constants.h"
#include "rl_csv.h"
#include "rl_records.h"

RecordSet::RecordSet(std::string name, std::vector<std::string> columns)
    : name_(std::move(name)), columns_(std::move(columns)) {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (!columnLookup_.emplace(columns_[i], i).second) {
            throw std::runtime_error("Duplicate column '" + columns_[i] + "' in dataset " + name_);
        }
    }
}

std::optional<std::size_t> RecordSet::columnIndex(const std::string& column) const {
    auto it = columnLookup_.find(column);
    if (it == columnLookup_.end()) return std::nullopt;
    return it->second;
}

void RecordSet::addRecord(std::vector<std::string> values) {
    if (values.size() > columns_.size()) {
        throw std::runtime_error("Record " + std::to_string(rows_.size()) + " of dataset " + name_ +
                                 " has " + std::to_string(values.size()) + " values for " +
                                 std::to_string(columns_.size()) + " columns");
    }
    values.resize(columns_.size());
    rows_.push_back(std::move(values));
}

// Function to load a dataset from CSV
RecordSet loadRecordSet(const std::filesystem::path& path, const std::string& name) {
    CsvReader reader(path);
    if (!reader.is_open()) {
        throw std::runtime_error("Failed to open dataset file: " + path.string());
    }

    std::vector<std::string> fields;
    if (!reader.readRow(fields)) {
        throw std::runtime_error("Dataset file has no header row: " + path.string());
    }

    RecordSet records(name, fields);
    while (reader.readRow(fields)) {
        // Blank lines are only skipped when they cannot be a record of a one-column dataset
        if (records.columns().size() > 1 && fields.size() == 1 && fields[0].empty()) continue;
        records.addRecord(std::move(fields));
        fields = {};
    }
    return records;
}

// Function to resolve a logical field name against a dataset
std::optional<std::string> resolveField(const FieldMap& fields, const RecordSet& records, const std::string& logical) {
    auto it = fields.find(logical);
    if (it == fields.end() || !records.hasColumn(it->second)) return std::nullopt;
    // The ordinal column name is reserved for the generated record index
    if (it->second == ORDINAL_COLUMN) return std::nullopt;
    return it->second;
}
