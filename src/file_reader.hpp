#pragma once
/*
 * FileReader
 *
 * Purpose: read a file via mmap and split it into lines, recording each
 *          line's terminator width (1 for \n, 2 for \r\n, 0 after the last).
 * Usage: mmap_read_lines(path, lines, eols, msg); false with msg on failure.
 */
#include <vector>
#include <string>
#include <filesystem>

bool mmap_read_lines(const std::filesystem::path& path,
                     std::vector<std::string>& out_lines,
                     std::vector<unsigned char>& out_eols,
                     std::string& msg);

void split_lines(const char* data, size_t n,
                 std::vector<std::string>& out_lines,
                 std::vector<unsigned char>& out_eols);
