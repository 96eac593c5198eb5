#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace corpusflux
{

// Lazy depth-first enumeration of regular files ending in the given suffix.
// Single pass: once next() returns false the walker stays exhausted.
// Directories that cannot be listed are logged, counted and skipped.
class PartitionWalker
{
  public:
    explicit PartitionWalker(const std::string &root, std::string suffix = ".jsonl");

    bool next(std::string &path);

    std::size_t directory_errors() const { return directory_errors_; }

  private:
    bool push_directory(const std::filesystem::path &dir);
    void log_directory_error(const std::filesystem::path &dir, const std::error_code &ec);

    std::string suffix_;
    std::vector<std::filesystem::directory_iterator> stack_;
    std::size_t directory_errors_ = 0;
};

// Drains a walker into a sorted list of absolute paths.
std::vector<std::string> collect_partition_files(const std::string &root, std::size_t *directory_errors = nullptr);

} // namespace corpusflux
