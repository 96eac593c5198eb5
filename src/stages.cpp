#include "corpusflux/stages.hpp"

#include <filesystem>
#include <system_error>

#include "stage_util.hpp"

namespace corpusflux
{

bool validate_input_dir(const std::string &dir, std::string &err)
{
    std::error_code ec;
    auto status = std::filesystem::status(dir, ec);
    if (ec || !std::filesystem::exists(status))
    {
        err = "Input directory not found: " + dir;
        return false;
    }
    if (!std::filesystem::is_directory(status))
    {
        err = "Input path is not a directory: " + dir;
        return false;
    }
    return true;
}

namespace detail
{

std::filesystem::path normalized_absolute(const std::string &path)
{
    std::error_code ec;
    std::filesystem::path p = std::filesystem::absolute(path, ec);
    if (ec)
    {
        p = path;
    }
    p = p.lexically_normal();
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path())
    {
        p = p.parent_path();
    }
    return p;
}

bool is_within(const std::filesystem::path &path, const std::filesystem::path &dir)
{
    auto rel = path.lexically_relative(dir);
    if (rel.empty())
    {
        return false;
    }
    return *rel.begin() != "..";
}

double seconds_since(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::duration<double>>(std::chrono::steady_clock::now() - start)
        .count();
}

} // namespace detail

} // namespace corpusflux
