#pragma once

// ============================================================
// file_io.hpp -- Small-file helpers for downloaded content
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>

namespace file_io {

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

// Read entire small file into memory. Throws if the file can't be read.
std::vector<u8> read_small_file(const std::string& path);

// Write data to "<path>.part" and flush it. Returns the .part path.
// Throws on any I/O failure.
std::string write_part_file(const std::string& path, const std::vector<u8>& data);

// Rename a finished .part file over path so readers never observe a
// half-written file. Throws if the rename fails.
void commit_part_file(const std::string& part_path, const std::string& path);

// Remove a .part file that will not be committed. Missing files are ignored.
void discard_part_file(const std::string& part_path);

} // namespace file_io
