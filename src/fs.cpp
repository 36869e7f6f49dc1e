#include "fs.h"
#include "logger.h"

#include <cstdio>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace meshchat {

bool file_exists(const std::string& path) {
    if (path.empty()) return false;
    return access(path.c_str(), F_OK) == 0;
}

bool directory_exists(const std::string& path) {
    if (path.empty()) return false;

    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    return false;
}

bool create_directories(const std::string& path) {
    if (path.empty()) return false;

    if (directory_exists(path)) {
        return true;
    }

    // Create each missing prefix in turn
    for (size_t i = 1; i <= path.size(); ++i) {
        if (i != path.size() && path[i] != '/') {
            continue;
        }
        std::string prefix = path.substr(0, i);
        if (directory_exists(prefix)) {
            continue;
        }
        if (mkdir(prefix.c_str(), 0755) != 0 && errno != EEXIST) {
            LOG_ERROR("fs", "Failed to create directory " << prefix << ": " << std::strerror(errno));
            return false;
        }
    }
    return true;
}

bool write_file_atomic(const std::string& path, const std::string& content) {
    if (path.empty()) return false;

    std::string parent = get_parent_directory(path);
    if (!parent.empty() && !create_directories(parent)) {
        return false;
    }

    std::string temp_path = path + ".tmp";
    FILE* file = fopen(temp_path.c_str(), "wb");
    if (!file) {
        LOG_ERROR("fs", "Failed to create file: " << temp_path);
        return false;
    }

    size_t written = fwrite(content.data(), 1, content.size(), file);
    bool flushed = fflush(file) == 0;
    fclose(file);

    if (written != content.size() || !flushed) {
        LOG_ERROR("fs", "Failed to write complete content to file: " << temp_path);
        remove(temp_path.c_str());
        return false;
    }

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        LOG_ERROR("fs", "Failed to replace " << path << ": " << std::strerror(errno));
        remove(temp_path.c_str());
        return false;
    }
    return true;
}

bool read_file_text(const std::string& path, std::string& out_content) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        LOG_ERROR("fs", "Failed to open file for reading: " << path);
        return false;
    }

    out_content.clear();
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), file)) > 0) {
        out_content.append(buffer, n);
    }

    bool failed = ferror(file) != 0;
    fclose(file);

    if (failed) {
        LOG_ERROR("fs", "Failed to read file: " << path);
        return false;
    }
    return true;
}

bool delete_file(const std::string& path) {
    if (path.empty()) return false;
    return remove(path.c_str()) == 0;
}

std::string get_parent_directory(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return "";
    }
    if (pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

} // namespace meshchat
