#include "corpusflux/skip_cache.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>

#include "corpusflux/progress.hpp"

namespace corpusflux
{

bool stat_file_stamp(const std::string &path, FileStamp &stamp, std::string &err)
{
    stamp = {};
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
    {
        err = ec.message();
        return false;
    }
    if (!std::filesystem::exists(status))
    {
        return true;
    }
    stamp.exists = true;
    stamp.size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        err = ec.message();
        return false;
    }
    auto t = std::filesystem::last_write_time(path, ec);
    if (ec)
    {
        err = ec.message();
        return false;
    }
    stamp.mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
    return true;
}

bool SkipCache::stamp_for(const std::string &path, FileStamp &stamp, std::string &err)
{
    auto it = stamps_.find(path);
    if (it != stamps_.end())
    {
        stamp = it->second;
        return true;
    }
    if (!stat_file_stamp(path, stamp, err))
    {
        return false;
    }
    stamps_.emplace(path, stamp);
    return true;
}

SkipCheck SkipCache::check(const std::string &input_path, const std::string &output_path)
{
    ++lookups_;
    SkipCheck result;

    FileStamp out_stamp;
    std::string err;
    if (!stamp_for(output_path, out_stamp, err))
    {
        ++stat_failures_;
        print_line(std::cerr, "Could not stat " + output_path + ", will process. Error: " + err);
        return result;
    }
    if (!out_stamp.exists)
    {
        return result;
    }

    FileStamp in_stamp;
    if (!stamp_for(input_path, in_stamp, err) || !in_stamp.exists)
    {
        ++stat_failures_;
        if (err.empty())
        {
            err = "file not found";
        }
        print_line(std::cerr, "Could not stat " + input_path + ", will process. Error: " + err);
        return result;
    }

    if (out_stamp.size > 0 && out_stamp.mtime_ns > in_stamp.mtime_ns)
    {
        result.decision = SkipDecision::skip;
        result.input_size = in_stamp.size;
        result.output_size = out_stamp.size;
        ++skips_;
    }
    return result;
}

void SkipCache::invalidate(const std::string &path)
{
    stamps_.erase(path);
}

void SkipCache::clear()
{
    stamps_.clear();
    lookups_ = 0;
    skips_ = 0;
    stat_failures_ = 0;
}

} // namespace corpusflux
