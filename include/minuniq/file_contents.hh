#pragma once

#include <string>

// Throws on error
std::string get_file_contents(const std::string& path);
