#pragma once

#include <string>

namespace meshchat {

// Existence checks
bool file_exists(const std::string& path);
bool directory_exists(const std::string& path);

// Create a directory and all missing parents
bool create_directories(const std::string& path);

/**
 * Replace the file contents atomically: data is written to "<path>.tmp"
 * and renamed over the target so a crash never leaves a half-written file.
 * Missing parent directories are created.
 */
bool write_file_atomic(const std::string& path, const std::string& content);

/**
 * Read a whole file as text
 * @param path File to read
 * @param out_content File contents
 * @return false if the file could not be opened or read
 */
bool read_file_text(const std::string& path, std::string& out_content);

bool delete_file(const std::string& path);

// "a/b/c.json" -> "a/b", "c.json" -> ""
std::string get_parent_directory(const std::string& path);

} // namespace meshchat
