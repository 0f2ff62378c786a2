#pragma once
#include "csv_log.hpp"
#include <filesystem>
#include <string>
#include <json/json.h>

struct NoteRecord {
    std::string id;
    std::string title;
    std::string filename;
    std::string created_at;
    std::string tags;
    Json::Value to_json() const;
};

struct TransactionRecord {
    std::string id;
    std::string date;
    std::string amount;
    std::string merchant;
    std::string category;
    std::string account;
    std::string notes;
    Json::Value raw_json; // the request payload, extra keys included
    Json::Value to_json() const;
};

struct ScrapeRecord {
    std::string id;
    std::string url;
    std::string fetched_at;
    std::string filename_html;
    std::string filename_txt;
    std::string title;
    Json::Value to_json() const;
};

struct WeightRecord {
    std::string id;
    std::string date;
    std::string weight_kg;
    std::string weight_lb;
    std::string body_fat_pct;
    std::string source;
    std::string notes;
    Json::Value raw_json;
    Json::Value to_json() const;
};

inline constexpr double LB_PER_KG = 2.2046226218;

// Flat-file record store rooted at one data directory. Every save_* writes
// its artifacts, then appends one CSV row; all throw StorageError.
class Storage {
public:
    explicit Storage(const std::filesystem::path& root);

    NoteRecord save_note(const std::string& title, const std::string& content, const std::string& tags);
    TransactionRecord save_transaction(const Json::Value& payload);
    ScrapeRecord save_scrape(const std::string& url, const std::string& html,
                             const std::string& text, const std::string& title);
    WeightRecord save_weight(const Json::Value& payload);

    std::filesystem::path notes_dir() const;
    std::filesystem::path transactions_dir() const;
    std::filesystem::path scrapes_dir() const;
    std::filesystem::path weights_dir() const;

    const CsvLog& notes_log() const { return notes_; }
    const CsvLog& transactions_log() const { return transactions_; }
    const CsvLog& scrapes_log() const { return scrapes_; }
    const CsvLog& weights_log() const { return weights_; }

private:
    std::filesystem::path root_;
    CsvLog notes_;
    CsvLog transactions_;
    CsvLog scrapes_;
    CsvLog weights_;
};
