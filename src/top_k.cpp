#include "corpusflux/top_k.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <utility>

#include "corpusflux/jsonl_io.hpp"
#include "corpusflux/progress.hpp"

namespace corpusflux
{

TopKSelector::TopKSelector(std::size_t capacity) : capacity_(capacity)
{
    items_.reserve(std::min<std::size_t>(capacity_, 1 << 16) + 1);
}

bool TopKSelector::admit(TopKEntry entry)
{
    if (capacity_ == 0)
    {
        return false;
    }
    if (full() && entry.content_length <= threshold_)
    {
        return false;
    }

    // Equal lengths keep arrival order: insert after every entry that is not shorter.
    auto pos = std::upper_bound(items_.begin(), items_.end(), entry.content_length,
                                [](std::uint64_t len, const TopKEntry &e) { return len > e.content_length; });
    items_.insert(pos, std::move(entry));
    if (items_.size() > capacity_)
    {
        items_.pop_back();
    }
    if (full())
    {
        threshold_ = items_.back().content_length;
    }
    return true;
}

void TopKSelector::merge(const TopKSelector &other)
{
    if (&other == this)
    {
        return;
    }
    for (const auto &entry : other.items_)
    {
        if (full() && entry.content_length <= threshold_)
        {
            // other is sorted descending, nothing after this can qualify either.
            break;
        }
        admit(entry);
    }
}

bool select_from_file(const std::string &path, const std::string &text_field, TopKSelector &selector,
                      SelectFileStats &stats, std::string &err)
{
    stats = {};
    const std::string source = base_name(path);
    return read_text_lines(
        path,
        [&](const std::string &line) {
            if (line.empty())
            {
                return true;
            }
            ++stats.records;
            ParsedLine parsed = parse_record_line(line, text_field);
            if (parsed.kind == LineKind::parse_error)
            {
                ++stats.parse_errors;
                print_line(std::cerr, "Error in " + path + ": " + parsed.error);
                return true;
            }
            if (parsed.kind != LineKind::parsed)
            {
                return true;
            }
            const auto &text = parsed.record[text_field].get_ref<const std::string &>();
            const std::uint64_t len = text.size();
            if (len == 0 || (selector.full() && len <= selector.threshold()))
            {
                return true;
            }

            TopKEntry entry;
            entry.content_length = len;
            entry.source_file = source;
            auto url = parsed.record.find("url");
            if (url != parsed.record.end() && url->is_string())
            {
                entry.url = url->get<std::string>();
            }
            auto language = parsed.record.find("language");
            if (language != parsed.record.end() && language->is_string())
            {
                entry.language = language->get<std::string>();
                entry.has_language = true;
            }
            if (selector.admit(std::move(entry)))
            {
                ++stats.candidates;
            }
            return true;
        },
        err);
}

bool write_manifest(const std::string &path, const std::vector<TopKEntry> &entries, std::string &err)
{
    StagedFile out(path);
    if (!out.open(err))
    {
        return false;
    }
    for (const auto &entry : entries)
    {
        Record line = Record::object();
        line["content_length"] = entry.content_length;
        if (entry.has_language)
        {
            line["language"] = entry.language;
        }
        line["url"] = entry.url;
        line["source_file"] = entry.source_file;
        if (!out.write_line(dump_record(line)))
        {
            err = "failed to write: " + out.temp_path();
            return false;
        }
    }
    return out.commit(err);
}

void RemovalManifest::add(const std::string &source_file, const std::string &url)
{
    by_file_[base_name(source_file)].insert(url);
    ++expected_removals_;
}

const std::set<std::string> *RemovalManifest::urls_for(const std::string &file_base_name) const
{
    auto it = by_file_.find(file_base_name);
    if (it == by_file_.end())
    {
        return nullptr;
    }
    return &it->second;
}

bool load_removal_manifest(const std::string &path, RemovalManifest &manifest, std::string &err)
{
    manifest = {};
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        err = "manifest not found: " + path;
        return false;
    }
    std::uint64_t line_no = 0;
    return read_text_lines(
        path,
        [&](const std::string &line) {
            ++line_no;
            if (line.empty())
            {
                return true;
            }
            Record entry;
            try
            {
                entry = Record::parse(line);
            }
            catch (const nlohmann::json::parse_error &e)
            {
                ++manifest.malformed_lines_;
                print_line(std::cerr, "Skipping malformed manifest line " + std::to_string(line_no) + ": " + e.what());
                return true;
            }
            auto source = entry.is_object() ? entry.find("source_file") : entry.end();
            auto url = entry.is_object() ? entry.find("url") : entry.end();
            if (source == entry.end() || url == entry.end() || !source->is_string() || !url->is_string())
            {
                ++manifest.malformed_lines_;
                print_line(std::cerr, "Skipping manifest line " + std::to_string(line_no) +
                                          ": missing string source_file/url");
                return true;
            }
            manifest.add(source->get<std::string>(), url->get<std::string>());
            return true;
        },
        err);
}

} // namespace corpusflux
