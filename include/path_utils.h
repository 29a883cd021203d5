#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion, joining, executable lookup, whole-file I/O
 */

#include "common.h"
#include "errors.h"
#include <string>

namespace conductor {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/// Join two path fragments with exactly one '/' between them.
std::string join_path(const std::string& base, const std::string& name);

/// Last path component ("/a/b/c.wav" -> "c.wav").
std::string file_name(const std::string& path);

/**
 * Search $PATH for an executable named `name`.
 * Returns the full path, or empty string if not found.
 */
std::string find_executable(const std::string& name);

/// Directory part of path ("/a/b/c.wav" -> "/a/b"); empty when there is none.
std::string parent_path(const std::string& path);

/// True if path names an existing regular file with non-zero size.
bool file_exists(const std::string& path);

/// mkdir -p
VoidResult ensure_directory(const std::string& path);

/// Read a whole file as bytes
Result<Bytes> read_file_bytes(const std::string& path);

/// Write bytes to path, replacing it
VoidResult write_file_bytes(const std::string& path, const Bytes& bytes);

} // namespace conductor
