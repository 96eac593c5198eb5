#include "corpusflux/progress.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace corpusflux
{

namespace
{
std::mutex &console_mutex()
{
    static std::mutex mu;
    return mu;
}
} // namespace

void print_line(std::ostream &os, const std::string &line)
{
    std::lock_guard<std::mutex> lock(console_mutex());
    os << line << '\n';
    os.flush();
}

std::string format_duration(double seconds)
{
    int sec = static_cast<int>(seconds + 0.5);
    int h = sec / 3600;
    int m = (sec % 3600) / 60;
    int s = sec % 60;
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << h << ":" << std::setw(2) << m << ":" << std::setw(2) << s;
    return oss.str();
}

std::string format_megabytes(std::uint64_t bytes)
{
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss << std::setprecision(2) << static_cast<double>(bytes) / (1024.0 * 1024.0) << "MB";
    return oss.str();
}

ProgressTracker::ProgressTracker(std::uint64_t total_files, const std::string &label, std::uint64_t interval_ms)
    : label_(label), total_(total_files),
      interval_ns_(std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::milliseconds(interval_ms)).count())
{
    start_ = std::chrono::steady_clock::now();
}

void ProgressTracker::add(std::uint64_t files)
{
    done_files_.fetch_add(files, std::memory_order_relaxed);
    maybe_print(false);
}

void ProgressTracker::finish()
{
    maybe_print(true);
}

std::uint64_t ProgressTracker::done_files() const
{
    return done_files_.load(std::memory_order_relaxed);
}

std::int64_t ProgressTracker::elapsed_ns(std::chrono::steady_clock::time_point now) const
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now - start_).count();
}

void ProgressTracker::maybe_print(bool force)
{
    if (!force && elapsed_ns(std::chrono::steady_clock::now()) - last_print_ns_.load(std::memory_order_relaxed) <
                      interval_ns_)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(print_mu_);
    const auto now = std::chrono::steady_clock::now();
    const std::int64_t now_ns = elapsed_ns(now);
    if (!force && now_ns - last_print_ns_.load(std::memory_order_relaxed) < interval_ns_)
    {
        return;
    }
    last_print_ns_.store(now_ns, std::memory_order_relaxed);
    std::uint64_t done = done_files_.load(std::memory_order_relaxed);
    double elapsed = static_cast<double>(now_ns) / 1e9;
    double file_rate = elapsed > 0.0 ? static_cast<double>(done) / elapsed : 0.0;
    double pct = total_ > 0 ? 100.0 * static_cast<double>(done) / static_cast<double>(total_) : 0.0;
    double eta = (file_rate > 0.0 && total_ > done) ? static_cast<double>(total_ - done) / file_rate : 0.0;

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    if (total_ > 0)
    {
        oss << "[" << label_ << "] files " << done << "/" << total_ << " (" << std::setprecision(1) << pct << "%)";
    }
    else
    {
        oss << "[" << label_ << "] files " << done;
    }
    oss << " (" << std::setprecision(1) << file_rate << "/s)";
    oss << " elapsed " << format_duration(elapsed);
    if (total_ > 0 && done < total_)
    {
        oss << " eta " << format_duration(eta);
    }
    print_line(std::cerr, oss.str());
}

} // namespace corpusflux
