#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>

namespace corpusflux
{

// Writes one whole line; safe to call from worker threads.
void print_line(std::ostream &os, const std::string &line);

std::string format_duration(double seconds);
std::string format_megabytes(std::uint64_t bytes);

class ProgressTracker
{
  public:
    ProgressTracker(std::uint64_t total_files, const std::string &label, std::uint64_t interval_ms);
    // Safe to call from worker threads.
    void add(std::uint64_t files);
    void finish();

    std::uint64_t done_files() const;

  private:
    void maybe_print(bool force);

    std::int64_t elapsed_ns(std::chrono::steady_clock::time_point now) const;

    std::string label_;
    std::uint64_t total_ = 0;
    std::int64_t interval_ns_ = 0;
    std::atomic<std::uint64_t> done_files_{0};
    std::chrono::steady_clock::time_point start_;
    // Nanoseconds after start_ of the last printed line.
    std::atomic<std::int64_t> last_print_ns_{0};
    std::mutex print_mu_;
};

} // namespace corpusflux
