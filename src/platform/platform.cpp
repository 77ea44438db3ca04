#include "stackreg/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace stackreg {

namespace fs = std::filesystem;

namespace {

#ifndef _WIN32
// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    const char* hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[dis(gen)];
    }

    return base + ".tmp." + suffix;
}
#endif

} // namespace

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

EnvLookup process_env() {
    return [](const std::string& name) { return get_env(name); };
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;

#ifdef _WIN32
    std::string temp_path = path + ".tmp";

    std::ofstream temp_file(temp_path, std::ios::binary);
    if (!temp_file) {
        result.error = "failed to create temp file";
        return result;
    }
    temp_file.write(content.data(), static_cast<std::streamsize>(content.size()));
    temp_file.flush();
    temp_file.close();

    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to rename temp file";
        return result;
    }

    result.ok = true;
#else
    // POSIX: temp + fsync(file) + rename + fsync(dir)
    std::string dir_path = get_parent_directory(path);
    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    ssize_t written = write(fd, content.data(), content.size());
    if (written < 0 || static_cast<size_t>(written) != content.size()) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to write content";
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
#endif

    return result;
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    for (auto& c : result) {
        if (c == '\\') c = '/';
    }
    return result;
}

std::string get_parent_directory(const std::string& path) {
    return to_portable_path(fs::path(path).parent_path().string());
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (base.empty()) return to_portable_path(rel);
    if (rel.empty()) return to_portable_path(base);
    return to_portable_path((fs::path(base) / rel).string());
}

std::string resolve_path(const std::string& base, const std::string& rel) {
    fs::path p(rel);
    if (p.is_relative()) {
        p = fs::path(base.empty() ? current_directory() : base) / p;
    }
    std::string out = to_portable_path(p.lexically_normal().string());
    // "a/b/.." normalizes to "a/"
    while (out.size() > 1 && out.back() == '/' && out[out.size() - 2] != ':') {
        out.pop_back();
    }
    return out;
}

std::string current_directory() {
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) return ".";
    return to_portable_path(cwd.string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // namespace stackreg
