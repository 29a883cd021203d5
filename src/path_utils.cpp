#include "path_utils.h"
#include <cstdlib>
#include <string>
#include <sstream>
#include <fstream>
#include <iterator>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace conductor {

std::string expand_path(const std::string& path) {
    if (path.empty()) return path;
    if (path.size() == 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home);
        return path;
    }
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + path.substr(1);
        return path;
    }
    return path;
}

std::string join_path(const std::string& base, const std::string& name) {
    if (base.empty()) return name;
    if (name.empty()) return base;
    std::string result = base;
    while (result.size() > 1 && result.back() == '/') result.pop_back();
    std::string::size_type start = name.find_first_not_of('/');
    if (start == std::string::npos) return result;
    return result + "/" + name.substr(start);
}

std::string file_name(const std::string& path) {
    std::string::size_type pos = path.find_last_of("/\\");
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

std::string find_executable(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }
    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) return "";

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = join_path(dir, name);
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

Result<Bytes> read_file_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return make_io_error("cannot open " + path);
    }
    Bytes bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return make_io_error("failed reading " + path);
    }
    return bytes;
}

VoidResult write_file_bytes(const std::string& path, const Bytes& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return make_io_error("cannot write " + path);
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        return make_io_error("failed writing " + path);
    }
    return VoidResult();
}

std::string parent_path(const std::string& path) {
    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos) return "";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

bool file_exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && st.st_size > 0;
}

VoidResult ensure_directory(const std::string& path) {
    if (path.empty()) return VoidResult();
    struct stat st;
    if (::stat(path.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) return VoidResult();
        return make_io_error(path + " exists and is not a directory");
    }
    std::string parent = parent_path(path);
    if (!parent.empty() && parent != path) {
        auto made = ensure_directory(parent);
        if (made.is_error()) return made;
    }
    if (::mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
        return make_io_error("mkdir " + path + ": " + std::strerror(errno));
    }
    return VoidResult();
}

} // namespace conductor
