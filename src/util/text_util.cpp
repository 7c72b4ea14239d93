#include "util/text_util.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <regex>

namespace mangashelf {

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string replace_all(std::string s, const std::string& from,
                        const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

bool contains_ignore_case(const std::string& s, const std::string& substr) {
    return to_lower(s).find(to_lower(substr)) != std::string::npos;
}

bool equal_ignore_case(const std::string& a, const std::string& b) {
    return to_lower(a) == to_lower(b);
}

bool starts_with_ignore_case(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    return equal_ignore_case(s.substr(0, prefix.size()), prefix);
}

std::string create_slug(const std::string& title) {
    static const std::regex disallowed("[^a-z0-9\\-]");

    std::string slug = replace_all(to_lower(title), " ", "-");
    slug = std::regex_replace(slug, disallowed, "");
    while (slug.find("--") != std::string::npos) {
        slug = replace_all(slug, "--", "-");
    }

    size_t first = slug.find_first_not_of('-');
    if (first == std::string::npos) return "";
    size_t last = slug.find_last_not_of('-');
    return slug.substr(first, last - first + 1);
}

bool parse_int(const std::string& s, int& out) {
    if (s.empty()) return false;
    size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    if (i == s.size()) return false;
    for (size_t j = i; j < s.size(); j++) {
        if (s[j] < '0' || s[j] > '9') return false;
    }

    errno = 0;
    long v = std::strtol(s.c_str(), nullptr, 10);
    if (errno == ERANGE || v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

std::string file_stem(const std::string& filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0) return filename;
    return filename.substr(0, dot);
}

std::string file_extension_lower(const std::string& filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos) return "";
    return to_lower(filename.substr(dot));
}

bool is_image_file_name(const std::string& filename) {
    std::string ext = file_extension_lower(filename);
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png";
}

bool is_metadata_file_name(const std::string& filename) {
    if (filename == "metadata.json") return true;
    auto dot = filename.rfind('.');
    return dot != std::string::npos && filename.compare(dot, std::string::npos, ".json") == 0;
}

} // namespace mangashelf
