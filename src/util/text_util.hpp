#pragma once

#include <string>

namespace mangashelf {

// ASCII lowercase copy.
std::string to_lower(const std::string& s);

// Replace every occurrence of `from` (non-empty) with `to`.
std::string replace_all(std::string s, const std::string& from,
                        const std::string& to);

bool contains_ignore_case(const std::string& s, const std::string& substr);
bool equal_ignore_case(const std::string& a, const std::string& b);
bool starts_with_ignore_case(const std::string& s, const std::string& prefix);

// URL-safe identifier from a display title:
// lowercase, spaces to '-', drop everything outside [a-z0-9-],
// collapse "--" runs, trim leading/trailing '-'.
// e.g. "One Piece!" -> "one-piece"
std::string create_slug(const std::string& title);

// Strict base-10 integer parse: the whole string must be an optionally
// signed run of digits that fits in int.
bool parse_int(const std::string& s, int& out);

// File name without its final extension ("001.jpg" -> "001", "a" -> "a").
std::string file_stem(const std::string& filename);

// Final extension including the dot, lowercased (".jpg"), or "".
std::string file_extension_lower(const std::string& filename);

// True for .jpg / .jpeg / .png, case-insensitive.
bool is_image_file_name(const std::string& filename);

// Exact "metadata.json" or any ".json" extension.
bool is_metadata_file_name(const std::string& filename);

} // namespace mangashelf
