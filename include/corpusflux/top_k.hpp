#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace corpusflux
{

struct TopKEntry
{
    std::string url;
    std::string language;
    bool has_language = false;
    std::uint64_t content_length = 0;
    std::string source_file;
};

// Bounded collection of the K longest entries, kept sorted by descending content_length.
// Once full, the last entry's length is the admission threshold and anything at or
// below it is rejected without touching the collection.
class TopKSelector
{
  public:
    explicit TopKSelector(std::size_t capacity = 0);

    bool admit(TopKEntry entry);
    void merge(const TopKSelector &other);

    std::size_t capacity() const { return capacity_; }
    std::size_t size() const { return items_.size(); }
    bool full() const { return items_.size() >= capacity_; }
    std::uint64_t threshold() const { return threshold_; }
    const std::vector<TopKEntry> &entries() const { return items_; }

  private:
    std::size_t capacity_;
    std::uint64_t threshold_ = 0;
    std::vector<TopKEntry> items_;
};

struct SelectFileStats
{
    std::uint64_t records = 0;
    std::uint64_t candidates = 0;
    std::uint64_t parse_errors = 0;
};

// Offers every record of one file with a non-empty string text field to selector.
// content_length is the UTF-8 byte length of the text, not a character count.
bool select_from_file(const std::string &path, const std::string &text_field, TopKSelector &selector,
                      SelectFileStats &stats, std::string &err);

// One JSON object per line: content_length, language, url, source_file.
bool write_manifest(const std::string &path, const std::vector<TopKEntry> &entries, std::string &err);

class RemovalManifest
{
  public:
    void add(const std::string &source_file, const std::string &url);

    // nullptr when the base name is not in the manifest.
    const std::set<std::string> *urls_for(const std::string &file_base_name) const;

    const std::map<std::string, std::set<std::string>> &files() const { return by_file_; }
    std::uint64_t expected_removals() const { return expected_removals_; }
    std::uint64_t malformed_lines() const { return malformed_lines_; }
    bool empty() const { return by_file_.empty(); }

  private:
    friend bool load_removal_manifest(const std::string &path, RemovalManifest &manifest, std::string &err);

    std::map<std::string, std::set<std::string>> by_file_;
    std::uint64_t expected_removals_ = 0;
    std::uint64_t malformed_lines_ = 0;
};

// Keys entries by the base name of source_file.
bool load_removal_manifest(const std::string &path, RemovalManifest &manifest, std::string &err);

} // namespace corpusflux
