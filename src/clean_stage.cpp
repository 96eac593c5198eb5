#include "corpusflux/stages.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include "corpusflux/partition_walker.hpp"
#include "corpusflux/progress.hpp"
#include "corpusflux/record_transformer.hpp"
#include "corpusflux/skip_cache.hpp"
#include "corpusflux/worker_pool.hpp"
#include "stage_util.hpp"

namespace corpusflux
{

namespace
{
constexpr std::size_t kSkippedPreview = 5;

struct CleanJob
{
    std::string input;
    std::string output;
};
} // namespace

bool run_clean(const Config &cfg, CleanReport &report, std::string &err)
{
    report = {};
    const auto start = std::chrono::steady_clock::now();
    if (!validate_input_dir(cfg.input_dir, err))
    {
        return false;
    }

    const std::filesystem::path input_root = detail::normalized_absolute(cfg.input_dir);
    const std::filesystem::path output_root = detail::normalized_absolute(cfg.output_dir);
    if (detail::is_within(input_root, output_root))
    {
        err = "Input directory lies inside the output directory: " + cfg.input_dir;
        return false;
    }

    std::vector<CleanJob> jobs;
    for (const auto &file : collect_partition_files(input_root.string(), &report.directory_errors))
    {
        std::filesystem::path p(file);
        if (detail::is_within(p, output_root))
        {
            continue;
        }
        jobs.push_back({file, (output_root / p.lexically_relative(input_root)).string()});
    }
    if (jobs.empty())
    {
        err = "No .jsonl files found in " + cfg.input_dir;
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(output_root, ec);
    if (ec)
    {
        err = "failed to create output directory " + output_root.string() + ": " + ec.message();
        return false;
    }

    report.threads = effective_threads(cfg.threads);
    std::cerr << "Input: " << input_root.string() << "\n";
    std::cerr << "Output: " << output_root.string() << "\n";
    std::cerr << "Files: " << jobs.size() << "\n";
    std::cerr << "Threads: " << report.threads << "\n";
    std::cerr << "Resume: " << (cfg.resume ? "on" : "off") << "\n";

    std::vector<std::string> pending;
    std::unordered_map<std::string, std::string> output_for;
    SkipCache skip_cache;
    for (const auto &job : jobs)
    {
        if (cfg.resume)
        {
            SkipCheck check = skip_cache.check(job.input, job.output);
            if (check.decision == SkipDecision::skip)
            {
                ++report.stats.skipped_files;
                report.stats.skipped_bytes_before += check.input_size;
                report.stats.skipped_bytes_after += check.output_size;
                report.skipped_files.push_back(job.input);
                continue;
            }
        }
        pending.push_back(job.input);
        output_for[job.input] = job.output;
    }

    if (!report.skipped_files.empty())
    {
        std::cerr << "Skipping " << report.skipped_files.size() << " already processed files:\n";
        for (std::size_t i = 0; i < report.skipped_files.size() && i < kSkippedPreview; ++i)
        {
            std::cerr << "  - " << std::filesystem::path(report.skipped_files[i]).lexically_relative(input_root).string()
                      << "\n";
        }
        if (report.skipped_files.size() > kSkippedPreview)
        {
            std::cerr << "  ... and " << report.skipped_files.size() - kSkippedPreview << " more\n";
        }
    }

    TransformOptions options;
    options.text_field = cfg.text_field;
    options.meta_field = cfg.meta_field;
    const RecordTransformer transformer(options);

    ProgressTracker progress(pending.size(), "clean", cfg.progress_interval_ms);
    auto outcomes = run_file_tasks<CleaningStats>(
        pending, report.threads, "clean",
        [&](const std::string &input, CleaningStats &stats, std::string &task_err) {
            const std::string &output = output_for.at(input);
            std::error_code dir_ec;
            std::filesystem::create_directories(std::filesystem::path(output).parent_path(), dir_ec);
            if (dir_ec)
            {
                task_err = "failed to create directory for " + output + ": " + dir_ec.message();
                return false;
            }
            return transformer.transform_file(input, output, stats, task_err);
        },
        &progress);
    progress.finish();

    std::vector<CleaningStats> parts;
    parts.reserve(outcomes.size() + 1);
    parts.push_back(report.stats);
    for (std::size_t i = 0; i < outcomes.size(); ++i)
    {
        if (outcomes[i].ok)
        {
            parts.push_back(std::move(outcomes[i].result));
        }
        else
        {
            report.failed_files.push_back(pending[i]);
        }
    }
    report.stats = reduce_cleaning_stats(parts);
    report.stats.failed_files += report.failed_files.size();

    report.seconds = detail::seconds_since(start);
    print_cleaning_summary(report.stats, report.seconds);
    if (report.directory_errors > 0)
    {
        std::cerr << "Warning: " << report.directory_errors << " directories could not be listed under "
                  << cfg.input_dir << "\n";
    }
    if (!report.failed_files.empty())
    {
        std::cerr << "Failed files:\n";
        for (const auto &f : report.failed_files)
        {
            std::cerr << "  - " << f << "\n";
        }
    }
    return true;
}

} // namespace corpusflux
