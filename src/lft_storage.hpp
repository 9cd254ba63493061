// Reading files to send and persisting received ones
#pragma once

#include <string>

#include "lft_common.hpp"

namespace lft {

// Last path component ("a/b/c.txt" -> "c.txt")
std::string base_name(const std::string& path);

bool read_file(const std::string& path, Bytes& out, std::string& err);

// Creates dir (one level) if it does not exist yet
bool ensure_directory(const std::string& dir, std::string& err);

// Base name only; "", "." and ".." become "received.bin"
std::string sanitize_received_name(const std::string& name);

// dir/name, or dir/stem_N.ext for the first N >= 1 that does not exist
std::string unique_output_path(const std::string& dir, const std::string& name);

// Writes data under dir without overwriting anything already there
bool save_received_file(const std::string& dir, const std::string& name, const Bytes& data,
                        std::string& saved_path, std::string& err);

} // namespace lft
