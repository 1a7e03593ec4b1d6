#include "fs.h"
#include "logger.h"
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>
#include <errno.h>

#define LOG_FS_DEBUG(message) LOG_DEBUG("fs", message)
#define LOG_FS_ERROR(message) LOG_ERROR("fs", message)

namespace remotefm {

namespace {

// Position of the last path separator of either kind, or npos
size_t last_separator(const std::string& path) {
    return path.find_last_of("/\\");
}

} // anonymous namespace

bool file_exists(const char* path) {
    if (!path) return false;
    return access(path, F_OK) == 0;
}

bool directory_exists(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    return false;
}

bool is_file(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) == 0) {
        return S_ISREG(st.st_mode);
    }
    return false;
}

bool create_file(const char* path, const char* content) {
    if (!path) return false;
    return create_file_binary(path, content, content ? strlen(content) : 0);
}

bool create_file_binary(const char* path, const void* data, size_t size) {
    if (!path) return false;

    FILE* file = fopen(path, "wb");
    if (!file) {
        LOG_FS_ERROR("Failed to create file: " << path << " (" << strerror(errno) << ")");
        return false;
    }

    size_t written = 0;
    if (data && size > 0) {
        written = fwrite(data, 1, size, file);
    }
    fclose(file);

    if (data && written != size) {
        LOG_FS_ERROR("Failed to write complete data to file: " << path);
        return false;
    }
    return true;
}

bool create_directory(const char* path) {
    if (!path) return false;

    if (directory_exists(path)) {
        return true; // Already exists
    }

    return mkdir(path, 0755) == 0;
}

bool create_directories(const char* path) {
    if (!path || *path == '\0') return false;

    if (directory_exists(path)) {
        return true;
    }

    std::string partial(path);

    // Create every intermediate component, skipping a leading root separator
    for (size_t i = 1; i < partial.size(); ++i) {
        if (partial[i] == '/' || partial[i] == '\\') {
            partial[i] = '\0';
            const char* component = partial.c_str();
            if (!directory_exists(component) && !create_directory(component)) {
                LOG_FS_ERROR("Failed to create directory: " << component);
                return false;
            }
            partial[i] = '/';
        }
    }

    if (!create_directory(partial.c_str())) {
        LOG_FS_ERROR("Failed to create directory: " << partial);
        return false;
    }
    return true;
}

int64_t get_file_size(const char* path) {
    if (!path) return -1;

    struct stat st;
    if (stat(path, &st) == 0) {
        return static_cast<int64_t>(st.st_size);
    }
    return -1;
}

bool delete_file(const char* path) {
    if (!path) return false;

    if (remove(path) != 0) {
        LOG_FS_DEBUG("Could not delete " << path << ": " << strerror(errno));
        return false;
    }
    return true;
}

bool delete_directory(const char* path) {
    if (!path) return false;
    return rmdir(path) == 0;
}

std::string get_filename_from_path(const char* path) {
    if (!path) return "";

    std::string p(path);
    size_t pos = last_separator(p);
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string get_file_extension(const char* path) {
    std::string filename = get_filename_from_path(path);
    size_t dot = filename.find_last_of('.');
    // Leading dot means a hidden file, not an extension
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return filename.substr(dot);
}

std::string get_filename_without_extension(const char* path) {
    std::string filename = get_filename_from_path(path);
    std::string extension = get_file_extension(path);
    return filename.substr(0, filename.size() - extension.size());
}

std::string get_parent_directory(const char* path) {
    if (!path) return "";

    std::string p(path);
    size_t pos = last_separator(p);
    if (pos == std::string::npos) {
        return "";
    }
    if (pos == 0) {
        return p.substr(0, 1);
    }
    return p.substr(0, pos);
}

std::string combine_paths(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;

    char last = base.back();
    if (last == '/' || last == '\\') {
        return base + relative;
    }
    return base + "/" + relative;
}

} // namespace remotefm
