#pragma once
#include <initializer_list>
#include <optional>
#include <string>
#include <json/json.h>

// Empty strings, zero, false, null and empty containers are "falsy".
bool truthy(const Json::Value& v);

// First truthy member among `keys`, or a null value.
Json::Value first_truthy(const Json::Value& obj, std::initializer_list<const char*> keys);

// Scalar rendered as text: strings verbatim, numbers in shortest round-trip
// form ("82.5", "3.0", "12"), booleans as True/False, null as "".
// Containers are rendered as compact JSON.
std::string to_text(const Json::Value& v);

// First number found in the value ("82.5kg" -> 82.5), or nullopt.
std::optional<double> to_float(const Json::Value& v);

std::string to_compact_json(const Json::Value& v);

// Decodes a request body into an object. An empty body is {}. A non-JSON
// body of the form a=1&b=2 is accepted as a flat string map. Returns false
// with `err` set otherwise.
bool parse_body(const std::string& body, Json::Value& out, std::string& err);
