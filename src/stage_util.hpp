#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace corpusflux::detail
{

// Absolute, lexically normalized, without a trailing separator.
std::filesystem::path normalized_absolute(const std::string &path);

// True when path lies inside dir (both normalized absolute paths).
bool is_within(const std::filesystem::path &path, const std::filesystem::path &dir);

double seconds_since(std::chrono::steady_clock::time_point start);

} // namespace corpusflux::detail
