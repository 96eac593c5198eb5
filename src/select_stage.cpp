#include "corpusflux/stages.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "corpusflux/partition_walker.hpp"
#include "corpusflux/progress.hpp"
#include "corpusflux/worker_pool.hpp"
#include "stage_util.hpp"

namespace corpusflux
{

namespace
{
struct FilePartial
{
    TopKSelector selector{0};
    SelectFileStats stats;
};

std::string format_kilobytes(std::uint64_t bytes)
{
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss << std::setprecision(2) << static_cast<double>(bytes) / 1024.0 << "KB";
    return oss.str();
}
} // namespace

bool run_select(const Config &cfg, SelectReport &report, std::string &err)
{
    report = {};
    const auto start = std::chrono::steady_clock::now();
    if (!validate_input_dir(cfg.input_dir, err))
    {
        return false;
    }

    auto files = collect_partition_files(cfg.input_dir, &report.directory_errors);
    report.files = files.size();
    report.threads = effective_threads(cfg.threads);
    const std::size_t wave_size = selector_wave_size(report.threads, cfg.wave_files);
    report.waves = (files.size() + wave_size - 1) / wave_size;

    std::cerr << "Input: " << detail::normalized_absolute(cfg.input_dir).string() << "\n";
    std::cerr << "Files: " << files.size() << "\n";
    std::cerr << "Threads: " << report.threads << "\n";
    std::cerr << "Files per wave: " << wave_size << "\n";
    std::cerr << "Top N: " << cfg.top_n << "\n";
    if (files.empty())
    {
        std::cerr << "Warning: no .jsonl files found in " << cfg.input_dir << "\n";
    }

    TopKSelector main_selector(cfg.top_n);
    std::size_t done = 0;
    for (std::size_t w = 0; w < report.waves; ++w)
    {
        const std::size_t begin = w * wave_size;
        const std::size_t end = std::min(files.size(), begin + wave_size);
        std::vector<std::string> wave(files.begin() + static_cast<std::ptrdiff_t>(begin),
                                      files.begin() + static_cast<std::ptrdiff_t>(end));
        print_line(std::cerr, "Wave " + std::to_string(w + 1) + "/" + std::to_string(report.waves) + " (" +
                                  std::to_string(wave.size()) + " files)");

        auto outcomes = run_file_tasks<FilePartial>(
            wave, report.threads, "select",
            [&](const std::string &path, FilePartial &partial, std::string &task_err) {
                partial.selector = TopKSelector(cfg.top_n);
                return select_from_file(path, cfg.text_field, partial.selector, partial.stats, task_err);
            });

        TopKSelector wave_selector(cfg.top_n);
        for (std::size_t i = 0; i < outcomes.size(); ++i)
        {
            if (!outcomes[i].ok)
            {
                report.failed_files.push_back(wave[i]);
                continue;
            }
            wave_selector.merge(outcomes[i].result.selector);
            report.records += outcomes[i].result.stats.records;
            report.parse_errors += outcomes[i].result.stats.parse_errors;
        }
        main_selector.merge(wave_selector);

        done += wave.size();
        std::ostringstream pct;
        pct.setf(std::ios::fixed);
        pct << std::setprecision(1) << 100.0 * static_cast<double>(done) / static_cast<double>(files.size());
        print_line(std::cerr, "Progress: " + pct.str() + "% (" + std::to_string(done) + "/" +
                                  std::to_string(files.size()) + " files, threshold " +
                                  std::to_string(main_selector.threshold()) + ")");
    }

    report.entries = main_selector.entries();
    if (!write_manifest(cfg.manifest_path, report.entries, err))
    {
        return false;
    }
    report.seconds = detail::seconds_since(start);

    std::ostream &out = std::cout;
    out << "\nWrote " << report.entries.size() << " entries to " << cfg.manifest_path << "\n";
    out << "Records scanned: " << report.records << " (parse errors: " << report.parse_errors << ")\n";
    const std::size_t shown = std::min(cfg.summary_top, report.entries.size());
    if (shown > 0)
    {
        out << "\nTop " << shown << " largest entries (UTF-8 bytes of " << cfg.text_field << "):\n";
        for (std::size_t i = 0; i < shown; ++i)
        {
            const auto &e = report.entries[i];
            out << i + 1 << ". " << format_kilobytes(e.content_length) << " - " << e.url << " (" << e.source_file
                << ")\n";
        }
    }
    out.setf(std::ios::fixed);
    out << "\nCompleted in " << std::setprecision(1) << report.seconds << "s\n";
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
