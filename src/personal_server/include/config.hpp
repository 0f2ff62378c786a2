#pragma once
#include <cstddef>
#include <string>

namespace cfg {
// Network
inline const std::string DEFAULT_HOST = "127.0.0.1";
inline constexpr int DEFAULT_PORT = 8080;
inline constexpr int LISTEN_BACKLOG = 16;

// Data layout (relative to the data root)
inline const std::string NOTES_DIR        = "notes";
inline const std::string TRANSACTIONS_DIR = "transactions";
inline const std::string SCRAPES_DIR      = "scrapes";
inline const std::string WEIGHTS_DIR      = "weights";

inline const std::string NOTES_CSV        = "notes.csv";
inline const std::string TRANSACTIONS_CSV = "transactions.csv";
inline const std::string SCRAPES_CSV      = "scrapes.csv";
inline const std::string WEIGHTS_CSV      = "weights.csv";

// Scraper
inline constexpr long SCRAPE_TIMEOUT_SEC = 20;
inline const std::string USER_AGENT = "PersonalServer/1.0";

// Commands: longer timeouts run without a deadline
inline constexpr double MAX_COMMAND_TIMEOUT_SEC = 86400.0;

// Request limits
inline constexpr std::size_t MAX_HEAD_BYTES = 64 * 1024;
inline constexpr std::size_t MAX_BODY_BYTES = 16 * 1024 * 1024;

// Environment
inline const char* const ENV_ROOT = "PERSONAL_SERVER_ROOT";
inline const char* const ENV_HOST = "PERSONAL_SERVER_HOST";
inline const char* const ENV_PORT = "PERSONAL_SERVER_PORT";

struct Settings {
    std::string root = ".";
    std::string host = DEFAULT_HOST;
    int port = DEFAULT_PORT;
};

// Reads PERSONAL_SERVER_* from the environment. Returns false (and leaves
// err set) if PERSONAL_SERVER_PORT is not a valid port number.
bool load_settings(Settings& out, std::string& err);

bool parse_port(const std::string& s, int& port);
}
