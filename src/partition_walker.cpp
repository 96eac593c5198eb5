#include "corpusflux/partition_walker.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>
#include <utility>

#include "corpusflux/progress.hpp"

namespace corpusflux
{

namespace
{
bool ends_with(const std::string &s, const std::string &suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

PartitionWalker::PartitionWalker(const std::string &root, std::string suffix) : suffix_(std::move(suffix))
{
    std::error_code ec;
    std::filesystem::path abs_root = std::filesystem::absolute(root, ec);
    if (ec)
    {
        abs_root = root;
    }
    push_directory(abs_root.lexically_normal());
}

bool PartitionWalker::push_directory(const std::filesystem::path &dir)
{
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec)
    {
        log_directory_error(dir, ec);
        return false;
    }
    stack_.push_back(std::move(it));
    return true;
}

void PartitionWalker::log_directory_error(const std::filesystem::path &dir, const std::error_code &ec)
{
    ++directory_errors_;
    print_line(std::cerr, "Error reading directory " + dir.string() + ": " + ec.message());
}

bool PartitionWalker::next(std::string &path)
{
    while (!stack_.empty())
    {
        auto &it = stack_.back();
        if (it == std::filesystem::directory_iterator())
        {
            stack_.pop_back();
            continue;
        }

        std::filesystem::path entry_path = it->path();
        std::error_code ec;
        auto status = it->symlink_status(ec);

        std::error_code inc_ec;
        it.increment(inc_ec);
        if (inc_ec)
        {
            log_directory_error(entry_path.parent_path(), inc_ec);
            stack_.pop_back();
        }

        if (ec)
        {
            continue;
        }
        if (std::filesystem::is_directory(status))
        {
            push_directory(entry_path);
            continue;
        }
        if (std::filesystem::is_regular_file(status) && ends_with(entry_path.filename().string(), suffix_))
        {
            path = entry_path.string();
            return true;
        }
    }
    return false;
}

std::vector<std::string> collect_partition_files(const std::string &root, std::size_t *directory_errors)
{
    PartitionWalker walker(root);
    std::vector<std::string> files;
    std::string path;
    while (walker.next(path))
    {
        files.push_back(path);
    }
    std::sort(files.begin(), files.end());
    if (directory_errors)
    {
        *directory_errors = walker.directory_errors();
    }
    return files;
}

} // namespace corpusflux
