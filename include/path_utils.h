#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion and the per-user data directory
 */

#include <string>

namespace job_diary {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Per-user data directory: $JOBDIARY_HOME if set, else ~/.jobdiary
 */
std::string default_data_dir();

/**
 * Creates the parent directory of a file path if missing.
 * @return false when the directory could not be created
 */
bool ensure_parent_dir(const std::string& file_path);

} // namespace job_diary
