#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace corpusflux
{

struct CleaningStats
{
    std::uint64_t size_before = 0;
    std::uint64_t size_after = 0;
    std::map<std::string, std::uint64_t> rule_bytes_reduced;

    std::uint64_t processed_files = 0;
    std::uint64_t skipped_files = 0;
    std::uint64_t failed_files = 0;

    // File sizes of inputs/outputs reused from a previous run.
    std::uint64_t skipped_bytes_before = 0;
    std::uint64_t skipped_bytes_after = 0;

    std::uint64_t records_read = 0;
    std::uint64_t records_written = 0;
    std::uint64_t records_dropped = 0;
    std::uint64_t records_passed_through = 0;
    std::uint64_t parse_errors = 0;

    CleaningStats &operator+=(const CleaningStats &other);
};

CleaningStats operator+(CleaningStats lhs, const CleaningStats &rhs);

CleaningStats reduce_cleaning_stats(const std::vector<CleaningStats> &parts);

void print_cleaning_summary(const CleaningStats &stats, double seconds);

} // namespace corpusflux
