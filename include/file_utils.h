#pragma once

#include <string>
#include <vector>

bool directory_exists(const std::string & dir_path);

bool file_exists(const std::string & file_path);

bool read_file_lines(const std::string& file_path, std::vector<std::string>& lines);

// writes to a sibling temp file first and renames it over the target
bool write_file_atomically(const std::string& file_path, const std::string& content);

bool append_to_file(const std::string& file_path, const std::string& content);
