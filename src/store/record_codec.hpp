#pragma once

#include <string>

#include <json/json.h>

#include "model/chapter.hpp"
#include "model/series.hpp"

namespace mangashelf {

// Sidecar JSON <-> record conversion. `path` is never encoded or decoded.
// Keys use the camelCase names of the on-disk metadata.json files.

Json::Value series_to_json(const Series& s);
Json::Value chapter_to_json(const Chapter& c);

// Decode into `s`, starting from default values. Absent or null keys keep
// defaults; unknown keys are ignored. Wrongly typed values or malformed
// timestamps set error_msg and return false.
bool series_from_json(const Json::Value& root, Series& s, std::string& error_msg);
bool chapter_from_json(const Json::Value& root, Chapter& c, std::string& error_msg);

// Integral chapter numbers are written as JSON integers ("3", not "3.0").
Json::Value chapter_number_to_json(const ChapterNumber& n);

// Pretty-printed, two-space indentation, trailing newline.
std::string to_pretty_json(const Json::Value& v);

// Parse a whole document. On failure sets error_msg and returns false.
bool parse_json(const std::string& text, Json::Value& root, std::string& error_msg);

} // namespace mangashelf
