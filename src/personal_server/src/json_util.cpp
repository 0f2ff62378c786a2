#include "json_util.hpp"
#include "utils.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <memory>
#include <sstream>

bool truthy(const Json::Value& v) {
    switch (v.type()) {
    case Json::nullValue:    return false;
    case Json::booleanValue: return v.asBool();
    case Json::intValue:     return v.asInt64() != 0;
    case Json::uintValue:    return v.asUInt64() != 0;
    case Json::realValue:    return v.asDouble() != 0.0;
    case Json::stringValue:  return !v.asString().empty();
    case Json::arrayValue:
    case Json::objectValue:  return !v.empty();
    }
    return false;
}

Json::Value first_truthy(const Json::Value& obj, std::initializer_list<const char*> keys) {
    if (!obj.isObject()) return Json::Value();
    for (const char* k : keys) {
        const Json::Value& v = obj[k];
        if (truthy(v)) return v;
    }
    return Json::Value();
}

// Fewest significant digits that read back as `d`.
static int shortest_digits(double d, char* buf, size_t len) {
    int digits = 1;
    for (; digits < 17; digits++) {
        std::snprintf(buf, len, "%.*e", digits - 1, d);
        if (std::strtod(buf, nullptr) == d) return digits;
    }
    std::snprintf(buf, len, "%.*e", 16, d);
    return 17;
}

static std::string format_double(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";

    char buf[64];
    int digits = shortest_digits(d, buf, sizeof(buf));
    const char* e = std::strchr(buf, 'e');
    int exp = e ? std::atoi(e + 1) : 0;
    if (exp < -4 || exp >= 16) return buf;

    int decimals = digits - 1 - exp;
    if (decimals < 0) decimals = 0;
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, d);
    std::string s(buf);
    if (decimals == 0) s += ".0";
    return s;
}

std::string to_text(const Json::Value& v) {
    switch (v.type()) {
    case Json::nullValue:    return "";
    case Json::booleanValue: return v.asBool() ? "True" : "False";
    case Json::intValue:     return std::to_string(v.asInt64());
    case Json::uintValue:    return std::to_string(v.asUInt64());
    case Json::realValue:    return format_double(v.asDouble());
    case Json::stringValue:  return v.asString();
    case Json::arrayValue:
    case Json::objectValue:  return to_compact_json(v);
    }
    return "";
}

static size_t digit_run(const std::string& s, size_t i) {
    size_t j = i;
    while (j < s.size() && s[j] >= '0' && s[j] <= '9') j++;
    return j - i;
}

// Leftmost match of [-+]?[0-9]*\.?[0-9]+ in a single linear pass.
static size_t find_number(const std::string& s, size_t& len) {
    for (size_t i = 0; i < s.size(); i++) {
        size_t p = i;
        if (s[p] == '-' || s[p] == '+') p++;
        size_t int_digits = digit_run(s, p);
        size_t q = p + int_digits;
        size_t frac_digits = (q < s.size() && s[q] == '.') ? digit_run(s, q + 1) : 0;
        if (frac_digits) { len = q + 1 + frac_digits - i; return i; }
        if (int_digits) { len = q - i; return i; }
    }
    return std::string::npos;
}

static void max_digits(const Json::Value& v, int& digits) {
    if (v.type() == Json::realValue) {
        char buf[64];
        digits = std::max(digits, shortest_digits(v.asDouble(), buf, sizeof(buf)));
    } else if (v.isArray() || v.isObject()) {
        for (const auto& child : v) max_digits(child, digits);
    }
}

std::optional<double> to_float(const Json::Value& v) {
    switch (v.type()) {
    case Json::nullValue:    return std::nullopt;
    case Json::booleanValue: return v.asBool() ? 1.0 : 0.0;
    case Json::intValue:
    case Json::uintValue:
    case Json::realValue:    return v.asDouble();
    default: break;
    }
    std::string s = trim(to_text(v));
    size_t len = 0;
    size_t pos = find_number(s, len);
    if (pos == std::string::npos) return std::nullopt;
    return std::strtod(s.substr(pos, len).c_str(), nullptr);
}

std::string to_compact_json(const Json::Value& v) {
    Json::StreamWriterBuilder b;
    b["indentation"] = "";
    b["emitUTF8"] = true;
    // enough digits for every double in the tree to read back exactly
    int digits = 1;
    max_digits(v, digits);
    b["precision"] = digits;
    b["precisionType"] = "significant";
    return Json::writeString(b, v);
}

static bool parse_form(const std::string& body, Json::Value& out) {
    Json::Value obj(Json::objectValue);
    std::istringstream ss(body);
    std::string pair;
    while (std::getline(ss, pair, '&')) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) return false;
        obj[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
    }
    out = obj;
    return true;
}

bool parse_body(const std::string& body, Json::Value& out, std::string& err) {
    if (body.empty()) { out = Json::Value(Json::objectValue); return true; }

    Json::CharReaderBuilder b;
    b["failIfExtra"] = true;
    b["allowComments"] = false;
    std::unique_ptr<Json::CharReader> reader(b.newCharReader());
    Json::Value parsed;
    std::string errs;
    if (!reader->parse(body.data(), body.data() + body.size(), &parsed, &errs)) {
        if (body.find('=') != std::string::npos && body.find('{') == std::string::npos &&
            parse_form(body, out))
            return true;
        err = "Invalid JSON: " + trim(errs);
        return false;
    }
    if (!parsed.isObject()) {
        err = "Invalid JSON: expected an object";
        return false;
    }
    out = parsed;
    return true;
}
