#include "fs.h"
#include "logger.h"
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace netlaunch {

bool file_exists(const std::string& path) {
    return !path.empty() && access(path.c_str(), F_OK) == 0;
}

std::optional<std::string> read_file_text(const std::string& path) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        LOG_ERROR("FS", "Failed to open file for reading: " << path);
        return std::nullopt;
    }

    std::string content;
    char buffer[8192];
    size_t bytes_read;
    while ((bytes_read = fread(buffer, 1, sizeof(buffer), file)) > 0) {
        content.append(buffer, bytes_read);
    }

    bool failed = ferror(file) != 0;
    fclose(file);

    if (failed) {
        LOG_ERROR("FS", "Failed to read file: " << path);
        return std::nullopt;
    }
    return content;
}

bool create_file(const std::string& path, const std::string& content) {
    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        LOG_ERROR("FS", "Failed to create file: " << path);
        return false;
    }

    size_t written = fwrite(content.data(), 1, content.size(), file);
    bool closed = fclose(file) == 0;

    if (written != content.size() || !closed) {
        LOG_ERROR("FS", "Failed to write complete content to file: " << path);
        return false;
    }
    return true;
}

bool create_executable_file(const std::string& path, const std::string& content) {
    if (!create_file(path, content)) {
        return false;
    }
    if (chmod(path.c_str(), 0755) != 0) {
        LOG_ERROR("FS", "Failed to make " << path << " executable: " << strerror(errno));
        return false;
    }
    return true;
}

bool delete_file(const std::string& path) {
    if (unlink(path.c_str()) != 0) {
        LOG_DEBUG("FS", "Failed to delete " << path << ": " << strerror(errno));
        return false;
    }
    return true;
}

} // namespace netlaunch
