#include "csv_log.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <fstream>
#include <mutex>

namespace {
// Serializes appends across request threads so a header is never written twice.
std::mutex append_mtx;
}

CsvLog::CsvLog(std::filesystem::path path, std::vector<std::string> columns)
    : path_(std::move(path)), columns_(std::move(columns)) {}

void CsvLog::append(const CsvRow& row) const {
    std::vector<std::string> fields;
    fields.reserve(columns_.size());
    for (auto& c : columns_) {
        auto it = row.find(c);
        fields.push_back(it == row.end() ? std::string() : it->second);
    }

    std::lock_guard<std::mutex> lk(append_mtx);
    if (path_.has_parent_path()) ensure_dir(path_.parent_path());

    std::error_code ec;
    bool is_new = !std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0;

    std::ofstream out(path_, std::ios::binary | std::ios::app);
    if (!out) throw StorageError("cannot open " + path_.string() + " for append");
    if (is_new) out << csv_line(columns_);
    out << csv_line(fields);
    out.flush();
    if (!out) throw StorageError("append to " + path_.string() + " failed");
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string q = "\"";
    for (char c : field) {
        if (c == '"') q += "\"\"";
        else q += c;
    }
    q += '"';
    return q;
}

std::string csv_line(const std::vector<std::string>& fields) {
    std::string line;
    for (size_t i = 0; i < fields.size(); i++) {
        if (i) line += ',';
        line += csv_escape(fields[i]);
    }
    line += "\r\n";
    return line;
}
