#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "corpusflux/cleaning_stats.hpp"
#include "corpusflux/config.hpp"
#include "corpusflux/top_k.hpp"

namespace corpusflux
{

struct CleanReport
{
    CleaningStats stats;
    std::vector<std::string> skipped_files;
    std::vector<std::string> failed_files;
    std::size_t directory_errors = 0; // directories the walk could not list
    std::size_t threads = 0;
    double seconds = 0.0;
};

struct SelectReport
{
    std::uint64_t files = 0;
    std::uint64_t records = 0;
    std::uint64_t parse_errors = 0;
    std::size_t waves = 0;
    std::size_t threads = 0;
    std::vector<TopKEntry> entries;
    std::vector<std::string> failed_files;
    std::size_t directory_errors = 0;
    double seconds = 0.0;
};

struct RemoveFileReport
{
    std::string path;
    std::uint64_t removed = 0;
};

struct RemoveReport
{
    std::uint64_t files_scanned = 0;
    std::uint64_t files_matched = 0;
    std::uint64_t files_rewritten = 0;
    std::uint64_t removed = 0;
    std::uint64_t expected_removals = 0;
    std::uint64_t malformed = 0;
    std::vector<RemoveFileReport> per_file; // path order, files with removals only
    std::vector<std::string> missing_files; // manifest keys not found in the tree
    std::vector<std::string> collisions;    // manifest keys matching more than one file
    std::vector<std::string> failed_files;
    std::size_t directory_errors = 0;
    std::size_t threads = 0;
    double seconds = 0.0;
};

// Each stage returns false on a fatal error (bad input directory, missing
// manifest, unwritable output) with err set. Per-file failures do not stop the
// stage; they are listed in the report's failed_files.
bool run_clean(const Config &cfg, CleanReport &report, std::string &err);
bool run_select(const Config &cfg, SelectReport &report, std::string &err);
bool run_remove(const Config &cfg, RemoveReport &report, std::string &err);

// Input directory must exist and be a directory.
bool validate_input_dir(const std::string &dir, std::string &err);

} // namespace corpusflux
