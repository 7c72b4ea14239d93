#include "util/file_util.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "core/config.hpp"

namespace mangashelf {

namespace fs = std::filesystem;

bool list_directory(const std::string& path, std::vector<DirEntry>& entries,
                    std::string& error_msg) {
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        error_msg = "cannot read directory " + path + ": " + ec.message();
        return false;
    }

    entries.clear();
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        DirEntry e;
        e.name = it->path().filename().string();
        std::error_code st_ec;
        e.is_dir = it->is_directory(st_ec);
        e.is_regular = !st_ec && it->is_regular_file(st_ec);
        entries.push_back(std::move(e));
    }
    if (ec) {
        error_msg = "error while reading directory " + path + ": " + ec.message();
        return false;
    }

    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
    return true;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool dir_exists(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool read_file_string(const std::string& path, std::string& content,
                      std::string& error_msg) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        error_msg = "cannot open " + path + ": " + std::strerror(errno);
        return false;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        error_msg = "read error on " + path;
        return false;
    }
    content = oss.str();
    return true;
}

static bool write_all(int fd, const std::string& content) {
    const char* p = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

bool write_file_atomic(const std::string& path, const std::string& content,
                       std::string& error_msg) {
    // Each call gets its own temporary; concurrent writers never share one.
    std::string tmpl = path + kTempSuffix;
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        error_msg = "cannot create temporary for " + path + ": " + std::strerror(errno);
        return false;
    }
    std::string tmp_path(buf.data());

    if (::fchmod(fd, 0644) != 0 || !write_all(fd, content) || ::fsync(fd) != 0) {
        error_msg = "cannot write " + tmp_path + ": " + std::strerror(errno);
        ::close(fd);
        ::unlink(tmp_path.c_str());
        return false;
    }

    if (::close(fd) != 0) {
        error_msg = "cannot close " + tmp_path + ": " + std::strerror(errno);
        ::unlink(tmp_path.c_str());
        return false;
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        error_msg = "cannot rename " + tmp_path + " to " + path + ": " +
                    std::strerror(errno);
        ::unlink(tmp_path.c_str());
        return false;
    }
    return true;
}

bool make_directories(const std::string& path, std::string& error_msg) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        error_msg = "cannot create directory " + path + ": " + ec.message();
        return false;
    }
    return true;
}

std::string base_name(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto pos = p.find_last_of('/');
    return (pos == std::string::npos) ? p : p.substr(pos + 1);
}

std::string parent_dir(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) return ".";
    return parent.string();
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

} // namespace mangashelf
