#pragma once

#include <string>
#include <cstdint>
#include <cstdio>

namespace remotefm {

// File/Directory existence check
bool file_exists(const char* path);
bool directory_exists(const char* path);
bool is_file(const char* path);

// File creation
bool create_file(const char* path, const char* content);
bool create_file_binary(const char* path, const void* data, size_t size);

// Directory operations
bool create_directory(const char* path);
bool create_directories(const char* path); // Create parent directories if needed

// File information
int64_t get_file_size(const char* path);

// File operations
bool delete_file(const char* path);
bool delete_directory(const char* path);

// Path utilities. Both '/' and '\\' are accepted as separators since
// remote paths may come from either kind of host.
std::string get_filename_from_path(const char* path);
std::string get_file_extension(const char* path);      // includes the dot, "" if none
std::string get_filename_without_extension(const char* path);
std::string get_parent_directory(const char* path);
std::string combine_paths(const std::string& base, const std::string& relative);

// C++ convenience wrappers
inline bool file_exists(const std::string& path) { return file_exists(path.c_str()); }
inline bool directory_exists(const std::string& path) { return directory_exists(path.c_str()); }
inline bool is_file(const std::string& path) { return is_file(path.c_str()); }
inline bool create_file(const std::string& path, const std::string& content) {
    return create_file_binary(path.c_str(), content.data(), content.size());
}
inline bool create_directories(const std::string& path) { return create_directories(path.c_str()); }
inline int64_t get_file_size(const std::string& path) { return get_file_size(path.c_str()); }
inline bool delete_file(const std::string& path) { return delete_file(path.c_str()); }
inline bool delete_directory(const std::string& path) { return delete_directory(path.c_str()); }
inline std::string get_filename_from_path(const std::string& path) { return get_filename_from_path(path.c_str()); }
inline std::string get_file_extension(const std::string& path) { return get_file_extension(path.c_str()); }
inline std::string get_filename_without_extension(const std::string& path) {
    return get_filename_without_extension(path.c_str());
}
inline std::string get_parent_directory(const std::string& path) { return get_parent_directory(path.c_str()); }

} // namespace remotefm
