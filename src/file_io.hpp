#pragma once
/*
 * FileIO
 *
 * Purpose: small whole-file helpers for the rc file, the session record and
 * editor previews.
 *   - read_file_lines: mmap + split into lines; CRLF normalized; stops after max_lines (0 = all)
 *   - read_file_text: whole file as one string
 *   - write_file_atomic: write to "<path>.tmp", fdatasync, rename over path
 * All return false with msg on failure.
 */
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

bool read_file_lines(const std::filesystem::path& path, std::vector<std::string>& out_lines, std::string& msg,
                     size_t max_lines = 0);
bool read_file_text(const std::filesystem::path& path, std::string& out, std::string& msg);
bool write_file_atomic(const std::filesystem::path& path, const std::string& data, std::string& msg);
