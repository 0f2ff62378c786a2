#include "config.hpp"
#include <cstdlib>

namespace cfg {

bool parse_port(const std::string& s, int& port) {
    if (s.empty() || s.size() > 5) return false;
    int v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    if (v <= 0 || v > 65535) return false;
    port = v;
    return true;
}

bool load_settings(Settings& out, std::string& err) {
    if (const char* root = std::getenv(ENV_ROOT); root && *root) out.root = root;
    if (const char* host = std::getenv(ENV_HOST); host && *host) out.host = host;
    if (const char* port = std::getenv(ENV_PORT); port && *port) {
        if (!parse_port(port, out.port)) {
            err = std::string("invalid ") + ENV_PORT + ": " + port;
            return false;
        }
    }
    return true;
}

}
