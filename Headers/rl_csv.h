#pragma once
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <vector>

// Sequential reader of RFC-4180 style CSV files (quoted fields may span lines)
class CsvReader {
public:
    explicit CsvReader(const std::filesystem::path& path);

    CsvReader(const CsvReader&) = delete;
    CsvReader& operator=(const CsvReader&) = delete;

    bool is_open() const { return input_.is_open(); }

    // Read the next row into fields; false at end of file
    bool readRow(std::vector<std::string>& fields);

private:
    std::ifstream input_;
};

// Quote a field if it contains a delimiter, quote or line break
std::string escapeCsvField(const std::string& field);

// Write one row terminated by a newline
void writeCsvRow(std::ostream& out, const std::vector<std::string>& fields);
