#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace corpusflux
{

enum class SkipDecision
{
    process = 0,
    skip
};

struct FileStamp
{
    bool exists = false;
    std::uint64_t size = 0;
    std::int64_t mtime_ns = 0;
};

struct SkipCheck
{
    SkipDecision decision = SkipDecision::process;
    std::uint64_t input_size = 0;
    std::uint64_t output_size = 0;
};

// Decides whether an input needs reprocessing: skip only when the output exists,
// is non-empty and was modified strictly after the input. Any stat failure
// falls back to process. Stamps are memoized for the lifetime of the object;
// one cache belongs to one run.
class SkipCache
{
  public:
    SkipCheck check(const std::string &input_path, const std::string &output_path);

    void invalidate(const std::string &path);
    void clear();

    std::size_t lookups() const { return lookups_; }
    std::size_t skips() const { return skips_; }
    std::size_t stat_failures() const { return stat_failures_; }

  private:
    bool stamp_for(const std::string &path, FileStamp &stamp, std::string &err);

    std::unordered_map<std::string, FileStamp> stamps_;
    std::size_t lookups_ = 0;
    std::size_t skips_ = 0;
    std::size_t stat_failures_ = 0;
};

bool stat_file_stamp(const std::string &path, FileStamp &stamp, std::string &err);

} // namespace corpusflux
