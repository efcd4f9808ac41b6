#pragma once

#include "haven/protocol/HttpHeaders.h"

#include <string>

namespace haven {
namespace protocol {

// Parses a JSON object of header fields, e.g. {"accept": "text/html", "x-n": 1}.
//
// Members keep document order; a repeated name keeps the last value. String,
// number, boolean and null values become header text. Anything else (arrays,
// nested objects, a top level that is not an object, trailing garbage, names
// or values that cannot appear in an HTTP header) fails with *err set.
bool ParseHeaderObject(const std::string& json, HeaderList* out, std::string* err);

} // namespace protocol
} // namespace haven
