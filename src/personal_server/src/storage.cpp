#include "storage.hpp"
#include "config.hpp"
#include "json_util.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <optional>

namespace fs = std::filesystem;

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

static std::string fixed(double v, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    return buf;
}

Json::Value NoteRecord::to_json() const {
    Json::Value j(Json::objectValue);
    j["id"] = id;
    j["title"] = title;
    j["filename"] = filename;
    j["created_at"] = created_at;
    j["tags"] = tags;
    return j;
}

Json::Value TransactionRecord::to_json() const {
    Json::Value j(Json::objectValue);
    j["id"] = id;
    j["date"] = date;
    j["amount"] = amount;
    j["merchant"] = merchant;
    j["category"] = category;
    j["account"] = account;
    j["notes"] = notes;
    j["raw_json"] = raw_json;
    return j;
}

Json::Value ScrapeRecord::to_json() const {
    Json::Value j(Json::objectValue);
    j["id"] = id;
    j["url"] = url;
    j["fetched_at"] = fetched_at;
    j["filename_html"] = filename_html;
    j["filename_txt"] = filename_txt;
    j["title"] = title;
    return j;
}

Json::Value WeightRecord::to_json() const {
    Json::Value j(Json::objectValue);
    j["id"] = id;
    j["date"] = date;
    j["weight_kg"] = weight_kg;
    j["weight_lb"] = weight_lb;
    j["body_fat_pct"] = body_fat_pct;
    j["source"] = source;
    j["notes"] = notes;
    j["raw_json"] = raw_json;
    return j;
}

Storage::Storage(const fs::path& root)
    : root_(root),
      notes_(root / cfg::NOTES_DIR / cfg::NOTES_CSV,
             {"id", "title", "filename", "created_at", "tags"}),
      transactions_(root / cfg::TRANSACTIONS_DIR / cfg::TRANSACTIONS_CSV,
                    {"id", "date", "amount", "merchant", "category", "account", "notes", "raw_json"}),
      scrapes_(root / cfg::SCRAPES_DIR / cfg::SCRAPES_CSV,
               {"id", "url", "fetched_at", "filename_html", "filename_txt", "title"}),
      weights_(root / cfg::WEIGHTS_DIR / cfg::WEIGHTS_CSV,
               {"id", "date", "weight_kg", "weight_lb", "body_fat_pct", "source", "notes", "raw_json"}) {}

fs::path Storage::notes_dir() const        { return root_ / cfg::NOTES_DIR; }
fs::path Storage::transactions_dir() const { return root_ / cfg::TRANSACTIONS_DIR; }
fs::path Storage::scrapes_dir() const      { return root_ / cfg::SCRAPES_DIR; }
fs::path Storage::weights_dir() const      { return root_ / cfg::WEIGHTS_DIR; }

NoteRecord Storage::save_note(const std::string& title, const std::string& content, const std::string& tags) {
    ensure_dir(notes_dir());
    NoteRecord rec;
    rec.id = short_id("note-");
    rec.title = title;
    rec.created_at = utc_now_str();
    rec.tags = tags;
    rec.filename = rec.created_at + "-" + slugify(title) + ".md";

    std::string frontmatter = "---\ntitle: " + title + "\ncreated_at: " + rec.created_at +
                              "\ntags: " + tags + "\n---\n\n";
    write_text(notes_dir() / rec.filename, frontmatter + content);

    notes_.append({{"id", rec.id}, {"title", rec.title}, {"filename", rec.filename},
                   {"created_at", rec.created_at}, {"tags", rec.tags}});
    return rec;
}

TransactionRecord Storage::save_transaction(const Json::Value& payload) {
    ensure_dir(transactions_dir());
    TransactionRecord rec;
    rec.id = short_id("txn-");
    Json::Value date = first_truthy(payload, {"date", "timestamp"});
    rec.date = truthy(date) ? to_text(date) : utc_now_str();
    rec.amount   = to_text(first_truthy(payload, {"amount", "value"}));
    rec.merchant = to_text(first_truthy(payload, {"merchant", "payee"}));
    rec.category = to_text(first_truthy(payload, {"category", "type"}));
    rec.account  = to_text(first_truthy(payload, {"account", "source"}));
    rec.notes    = to_text(first_truthy(payload, {"notes", "memo"}));
    rec.raw_json = payload;

    transactions_.append({{"id", rec.id}, {"date", rec.date}, {"amount", rec.amount},
                          {"merchant", rec.merchant}, {"category", rec.category},
                          {"account", rec.account}, {"notes", rec.notes},
                          {"raw_json", to_compact_json(rec.raw_json)}});
    return rec;
}

ScrapeRecord Storage::save_scrape(const std::string& url, const std::string& html,
                                  const std::string& text, const std::string& title) {
    ensure_dir(scrapes_dir());
    ScrapeRecord rec;
    rec.id = short_id("scrape-");
    rec.url = url;
    rec.fetched_at = utc_now_str();
    rec.title = title;
    std::string base = rec.fetched_at + "-" + slugify(title.empty() ? "page" : title);
    rec.filename_html = base + ".html";
    rec.filename_txt = base + ".txt";
    write_text(scrapes_dir() / rec.filename_html, html);
    write_text(scrapes_dir() / rec.filename_txt, text);

    scrapes_.append({{"id", rec.id}, {"url", rec.url}, {"fetched_at", rec.fetched_at},
                     {"filename_html", rec.filename_html}, {"filename_txt", rec.filename_txt},
                     {"title", rec.title}});
    return rec;
}

WeightRecord Storage::save_weight(const Json::Value& payload) {
    ensure_dir(weights_dir());
    WeightRecord rec;
    rec.id = short_id("wt-");
    Json::Value date = first_truthy(payload, {"date", "timestamp"});
    rec.date   = truthy(date) ? to_text(date) : utc_now_str();
    rec.source = to_text(first_truthy(payload, {"source", "device"}));
    rec.notes  = to_text(first_truthy(payload, {"notes", "memo"}));

    std::string unit = lower(trim(to_text(first_truthy(payload, {"unit"}))));

    // unit comes from `unit` or the value text, default kg
    Json::Value w_val = first_truthy(payload, {"weight", "weight_kg", "kg", "weight_lb", "lb"});

    std::string base = lower(to_text(w_val));
    if (unit.empty()) {
        if (base.find("lb") != std::string::npos || base.find("pound") != std::string::npos) unit = "lb";
        else if (base.find("kg") != std::string::npos) unit = "kg";
    }

    std::optional<double> val = to_float(w_val);
    if (val) {
        double kg, lb;
        if (unit == "lb" || unit == "lbs" || unit == "pound" || unit == "pounds") {
            lb = *val;
            kg = lb / LB_PER_KG;
        } else {
            kg = *val;
            lb = kg * LB_PER_KG;
        }
        rec.weight_kg = fixed(kg, 3);
        rec.weight_lb = fixed(lb, 3);
    }

    std::optional<double> bf = to_float(first_truthy(payload, {"body_fat_pct", "body_fat", "bodyFat", "bf"}));
    if (bf) rec.body_fat_pct = fixed(*bf, 2);
    rec.raw_json = payload;

    weights_.append({{"id", rec.id}, {"date", rec.date}, {"weight_kg", rec.weight_kg},
                     {"weight_lb", rec.weight_lb}, {"body_fat_pct", rec.body_fat_pct},
                     {"source", rec.source}, {"notes", rec.notes},
                     {"raw_json", to_compact_json(rec.raw_json)}});
    return rec;
}
