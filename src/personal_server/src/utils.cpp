#include "utils.hpp"
#include "errors.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>

std::string utc_now_str() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
    std::tm tm{};
    gmtime_r(&t, &tm); // thread-safe
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &tm);
    if (n == 0) return std::string();
    std::snprintf(buf + n, sizeof(buf) - n, ".%06lldZ", static_cast<long long>(micros));
    return std::string(buf);
}

std::string short_id(const std::string& prefix) {
    // Millisecond clock, bumped past the last issued value so two ids
    // generated in the same millisecond still differ.
    static std::atomic<long long> last{0};
    long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    long long prev = last.load();
    long long next;
    do {
        next = ms > prev ? ms : prev + 1;
    } while (!last.compare_exchange_weak(prev, next));
    return prefix + std::to_string(next);
}

std::string slugify(const std::string& text, size_t max_length) {
    std::string kept;
    for (unsigned char c : trim(text)) {
        c = (unsigned char)std::tolower(c);
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || std::isspace(c))
            kept.push_back((char)c);
    }

    std::string slug;
    for (size_t i = 0; i < kept.size(); i++) {
        char c = kept[i];
        if (std::isspace((unsigned char)c)) c = '-';
        if (c == '-' && !slug.empty() && slug.back() == '-') continue; // collapse runs
        slug.push_back(c);
    }

    if (slug.size() > max_length) slug.resize(max_length);
    size_t a = slug.find_first_not_of('-');
    if (a == std::string::npos) return "item";
    size_t b = slug.find_last_not_of('-');
    return slug.substr(a, b - a + 1);
}

std::string trim(const std::string& s) {
    const auto a = s.find_first_not_of(" \t\r\n\f\v");
    const auto b = s.find_last_not_of(" \t\r\n\f\v");
    if (a == std::string::npos) return "";
    return s.substr(a, b - a + 1);
}

void ensure_dir(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) throw StorageError("cannot create directory " + path.string() + ": " + ec.message());
}

void write_text(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw StorageError("cannot open " + path.string() + " for writing");
    out << content;
    out.flush();
    if (!out) throw StorageError("write to " + path.string() + " failed");
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& s) {
    std::string o;
    o.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (c == '+') { o += ' '; continue; }
        if (c == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]), lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) { o += (char)(hi * 16 + lo); i += 2; continue; }
        }
        o += c;
    }
    return o;
}
