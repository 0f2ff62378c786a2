#pragma once
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

using CsvRow = std::unordered_map<std::string, std::string>;

// Append-only CSV file with a fixed column order.
class CsvLog {
public:
    CsvLog(std::filesystem::path path, std::vector<std::string> columns);

    // Append one row (columns missing from `row` are left empty). Creates the
    // parent directory, and the header if the file is new or empty.
    // Throws StorageError.
    void append(const CsvRow& row) const;

    const std::filesystem::path& path() const { return path_; }
    const std::vector<std::string>& columns() const { return columns_; }

private:
    std::filesystem::path path_;
    std::vector<std::string> columns_;
};

// Quote a field if it contains a separator, quote or line break.
std::string csv_escape(const std::string& field);
// One CSV record, including the trailing "\r\n".
std::string csv_line(const std::vector<std::string>& fields);
