#pragma once

#include <string>
#include <vector>

namespace mangashelf {

struct DirEntry {
    std::string name;
    bool is_dir = false;
    bool is_regular = false;
};

// List immediate entries of a directory, sorted by name.
// Symlinks are classified by their target. On failure sets error_msg
// and returns false.
bool list_directory(const std::string& path, std::vector<DirEntry>& entries,
                    std::string& error_msg);

bool file_exists(const std::string& path);
bool dir_exists(const std::string& path);

// Read a whole file. On failure sets error_msg and returns false.
bool read_file_string(const std::string& path, std::string& content,
                      std::string& error_msg);

// Replace `path` with `content` atomically: write a uniquely named
// "<path>.tmp.XXXXXX" (mkstemp) in the same directory, flush to disk and
// rename over the target. A reader sees either the previous file or the new
// one. On failure the temporary file is
// removed, the target is left untouched, error_msg is set and false returned.
bool write_file_atomic(const std::string& path, const std::string& content,
                       std::string& error_msg);

// Create a directory and its parents. Succeeds if it already exists.
bool make_directories(const std::string& path, std::string& error_msg);

// Last path component ("/a/b/" -> "b").
std::string base_name(const std::string& path);

// Parent directory of a path ("/a/b/metadata.json" -> "/a/b").
std::string parent_dir(const std::string& path);

// Join two path components with a single '/'.
std::string join_path(const std::string& dir, const std::string& name);

} // namespace mangashelf
