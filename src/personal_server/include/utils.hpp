#pragma once
#include <string>
#include <filesystem>

std::string utc_now_str();              // e.g. "2025-08-16T14-32-10.123456Z"
std::string short_id(const std::string& prefix); // e.g. "note-1755354730123"
std::string slugify(const std::string& text, size_t max_length = 80);
std::string trim(const std::string& s);

// Both throw StorageError on failure.
void ensure_dir(const std::filesystem::path& path);
void write_text(const std::filesystem::path& path, const std::string& content);

// Decodes %XX escapes and '+' in a form-encoded component.
std::string url_decode(const std::string& s);
