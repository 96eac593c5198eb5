#include "corpusflux/cleaning_stats.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

#include "corpusflux/progress.hpp"

namespace corpusflux
{

CleaningStats &CleaningStats::operator+=(const CleaningStats &other)
{
    size_before += other.size_before;
    size_after += other.size_after;
    for (const auto &[name, bytes] : other.rule_bytes_reduced)
    {
        rule_bytes_reduced[name] += bytes;
    }
    processed_files += other.processed_files;
    skipped_files += other.skipped_files;
    failed_files += other.failed_files;
    skipped_bytes_before += other.skipped_bytes_before;
    skipped_bytes_after += other.skipped_bytes_after;
    records_read += other.records_read;
    records_written += other.records_written;
    records_dropped += other.records_dropped;
    records_passed_through += other.records_passed_through;
    parse_errors += other.parse_errors;
    return *this;
}

CleaningStats operator+(CleaningStats lhs, const CleaningStats &rhs)
{
    lhs += rhs;
    return lhs;
}

CleaningStats reduce_cleaning_stats(const std::vector<CleaningStats> &parts)
{
    CleaningStats total;
    for (const auto &part : parts)
    {
        total += part;
    }
    return total;
}

void print_cleaning_summary(const CleaningStats &stats, double seconds)
{
    const std::uint64_t before = stats.size_before + stats.skipped_bytes_before;
    const std::uint64_t after = stats.size_after + stats.skipped_bytes_after;
    const std::uint64_t reduced = before > after ? before - after : 0;
    const double reduction_pct = before > 0 ? 100.0 * static_cast<double>(reduced) / static_cast<double>(before) : 0.0;

    std::ostream &out = std::cout;
    out.setf(std::ios::fixed);
    out << "\n--- Cleanup Analysis ---\n";
    out << "Total size (UTF-8 bytes): " << format_megabytes(before) << " -> " << format_megabytes(after) << "\n";
    out << "Reduction: " << std::setprecision(1) << reduction_pct << "% (" << format_megabytes(reduced) << ")\n";

    std::vector<std::pair<std::string, std::uint64_t>> by_rule;
    for (const auto &kv : stats.rule_bytes_reduced)
    {
        if (kv.second > 0)
        {
            by_rule.push_back(kv);
        }
    }
    std::sort(by_rule.begin(), by_rule.end(), [](const auto &a, const auto &b) {
        return a.second != b.second ? a.second > b.second : a.first < b.first;
    });

    if (!by_rule.empty())
    {
        out << "\nReduction by pattern:\n";
        const std::uint64_t content_reduced = stats.size_before > stats.size_after ? stats.size_before - stats.size_after : 0;
        for (const auto &[name, bytes] : by_rule)
        {
            double share = content_reduced > 0 ? 100.0 * static_cast<double>(bytes) / static_cast<double>(content_reduced)
                                               : 0.0;
            out << "  - " << name << ": " << format_megabytes(bytes) << " (" << std::setprecision(1) << share
                << "% of total reduction)\n";
        }
    }
    else
    {
        out << "\nNo reduction recorded by specific patterns.\n";
    }

    out << "\n--- Processing Summary ---\n";
    out << "Files processed: " << stats.processed_files << "\n";
    out << "Files skipped: " << stats.skipped_files << "\n";
    if (stats.failed_files > 0)
    {
        out << "Files failed: " << stats.failed_files << "\n";
    }
    out << "Total files found: " << stats.processed_files + stats.skipped_files + stats.failed_files << "\n";
    out << "Records: read=" << stats.records_read << " written=" << stats.records_written
        << " dropped=" << stats.records_dropped << " passed_through=" << stats.records_passed_through
        << " parse_errors=" << stats.parse_errors << "\n";
    out << "Processing completed in " << std::setprecision(1) << seconds << "s\n";
}

} // namespace corpusflux
