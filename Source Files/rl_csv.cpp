#include "rl_csv.h"

CsvReader::CsvReader(const std::filesystem::path& path) : input_(path, std::ios::binary) {}

bool CsvReader::readRow(std::vector<std::string>& fields) {
    fields.clear();

    std::string line;
    if (!std::getline(input_, line)) return false;

    std::string current;
    bool inQuotes = false;

    while (true) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        for (std::size_t i = 0; i < line.size(); ++i) {
            const char c = line[i];
            if (inQuotes) {
                if (c == '"') {
                    // Doubled quote inside a quoted field
                    if (i + 1 < line.size() && line[i + 1] == '"') {
                        current += '"';
                        ++i;
                    }
                    else {
                        inQuotes = false;
                    }
                }
                else {
                    current += c;
                }
            }
            else if (c == '"') {
                inQuotes = true;
            }
            else if (c == ',') {
                fields.push_back(std::move(current));
                current.clear();
            }
            else {
                current += c;
            }
        }

        if (!inQuotes) break;

        // Quoted field continues on the next line
        if (!std::getline(input_, line)) break;
        current += '\n';
    }

    fields.push_back(std::move(current));
    return true;
}

std::string escapeCsvField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') escaped += '"';
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

void writeCsvRow(std::ostream& out, const std::vector<std::string>& fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out << ',';
        out << escapeCsvField(fields[i]);
    }
    out << '\n';
}
