#pragma once

// Shared test fixture: temporary catalog trees and tiny image files.

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <dirent.h>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace catalog_fixture {

// ---- Temporary directories ----

// Fresh directory under /tmp; exits the test on failure.
inline std::string make_temp_dir(const char* tag) {
    std::string tmpl = std::string("/tmp/mangashelf_") + tag + "_XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    char* dir = ::mkdtemp(buf.data());
    if (dir == nullptr) {
        std::fprintf(stderr, "mkdtemp failed for %s\n", tmpl.c_str());
        std::exit(2);
    }
    return dir;
}

inline void remove_recursive(const std::string& path) {
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0) return;
    if (S_ISDIR(st.st_mode)) {
        DIR* d = ::opendir(path.c_str());
        if (d) {
            struct dirent* ent;
            while ((ent = ::readdir(d)) != nullptr) {
                std::string name(ent->d_name);
                if (name == "." || name == "..") continue;
                remove_recursive(path + "/" + name);
            }
            ::closedir(d);
        }
        ::rmdir(path.c_str());
    } else {
        ::unlink(path.c_str());
    }
}

// Creates `path` and its missing parents.
inline void make_dir(const std::string& path) {
    for (size_t pos = 1; pos <= path.size(); pos++) {
        if (pos == path.size() || path[pos] == '/') {
            ::mkdir(path.substr(0, pos).c_str(), 0755);
        }
    }
}

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

inline bool exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

// Names in a directory, including hidden ones.
inline std::vector<std::string> list_names(const std::string& dir) {
    std::vector<std::string> names;
    DIR* d = ::opendir(dir.c_str());
    if (!d) return names;
    struct dirent* ent;
    while ((ent = ::readdir(d)) != nullptr) {
        std::string name(ent->d_name);
        if (name != "." && name != "..") names.push_back(name);
    }
    ::closedir(d);
    return names;
}

// ---- Image headers ----

inline void put_be32(std::string& s, uint32_t v) {
    s.push_back(static_cast<char>((v >> 24) & 0xFF));
    s.push_back(static_cast<char>((v >> 16) & 0xFF));
    s.push_back(static_cast<char>((v >> 8) & 0xFF));
    s.push_back(static_cast<char>(v & 0xFF));
}

inline void put_be16(std::string& s, uint16_t v) {
    s.push_back(static_cast<char>((v >> 8) & 0xFF));
    s.push_back(static_cast<char>(v & 0xFF));
}

// PNG signature plus IHDR; enough for a header probe.
inline std::string png_bytes(uint32_t width, uint32_t height) {
    std::string s("\x89PNG\r\n\x1a\n", 8);
    put_be32(s, 13);
    s += "IHDR";
    put_be32(s, width);
    put_be32(s, height);
    s += std::string("\x08\x02\x00\x00\x00", 5);
    put_be32(s, 0);  // CRC is not checked
    return s;
}

// SOI, an APP0 segment, then SOF0.
inline std::string jpeg_bytes(uint16_t width, uint16_t height) {
    std::string s("\xFF\xD8", 2);
    s += std::string("\xFF\xE0", 2);
    put_be16(s, 16);
    s += std::string("JFIF\0\x01\x01\x00\x00\x01\x00\x01\x00\x00", 14);
    s += std::string("\xFF\xC0", 2);
    put_be16(s, 17);
    s.push_back(8);
    put_be16(s, height);
    put_be16(s, width);
    s += std::string("\x03\x01\x22\x00\x02\x11\x01\x03\x11\x01", 10);
    s += std::string("\xFF\xD9", 2);
    return s;
}

// ---- Sidecars ----

inline std::string series_sidecar(const std::string& id, const std::string& title,
                                  const std::string& extra = "") {
    return "{\n  \"id\": \"" + id + "\",\n  \"title\": \"" + title + "\"" +
           (extra.empty() ? "" : ",\n  " + extra) + "\n}\n";
}

inline std::string chapter_sidecar(const std::string& id, const std::string& series_id,
                                   const std::string& number,
                                   const std::string& extra = "") {
    return "{\n  \"id\": \"" + id + "\",\n  \"mangaId\": \"" + series_id +
           "\",\n  \"number\": " + number +
           (extra.empty() ? "" : ",\n  " + extra) + "\n}\n";
}

} // namespace catalog_fixture
