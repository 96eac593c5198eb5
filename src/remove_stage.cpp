#include "corpusflux/stages.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <map>

#include "corpusflux/jsonl_io.hpp"
#include "corpusflux/partition_walker.hpp"
#include "corpusflux/progress.hpp"
#include "corpusflux/safe_rewriter.hpp"
#include "corpusflux/worker_pool.hpp"
#include "stage_util.hpp"

namespace corpusflux
{

bool run_remove(const Config &cfg, RemoveReport &report, std::string &err)
{
    report = {};
    const auto start = std::chrono::steady_clock::now();

    RemovalManifest manifest;
    if (!load_removal_manifest(cfg.manifest_path, manifest, err))
    {
        return false;
    }
    report.expected_removals = manifest.expected_removals();
    if (!validate_input_dir(cfg.input_dir, err))
    {
        return false;
    }

    auto files = collect_partition_files(cfg.input_dir, &report.directory_errors);
    report.files_scanned = files.size();

    std::map<std::string, std::vector<std::string>> matches;
    std::vector<std::string> targets;
    for (const auto &file : files)
    {
        std::string name = base_name(file);
        if (manifest.urls_for(name))
        {
            matches[name].push_back(file);
            targets.push_back(file);
        }
    }
    for (const auto &entry : manifest.files())
    {
        const std::string &name = entry.first;
        auto it = matches.find(name);
        if (it == matches.end())
        {
            report.missing_files.push_back(name);
        }
        else if (it->second.size() > 1)
        {
            report.collisions.push_back(name);
            std::cerr << "Warning: manifest entry " << name << " matches " << it->second.size()
                      << " files; URLs are removed from all of them:\n";
            for (const auto &path : it->second)
            {
                std::cerr << "  - " << path << "\n";
            }
        }
    }
    report.files_matched = targets.size();

    report.threads = effective_threads(cfg.threads);
    std::cerr << "Manifest: " << cfg.manifest_path << " (" << manifest.files().size() << " files, "
              << manifest.expected_removals() << " entries)\n";
    std::cerr << "Files: " << files.size() << " scanned, " << targets.size() << " listed in manifest\n";
    std::cerr << "Threads: " << report.threads << "\n";
    if (cfg.dry_run)
    {
        std::cerr << "Dry run: files will not be modified\n";
    }

    ProgressTracker progress(targets.size(), "remove", cfg.progress_interval_ms);
    auto outcomes = run_file_tasks<RewriteResult>(
        targets, report.threads, "remove",
        [&](const std::string &path, RewriteResult &result, std::string &task_err) {
            return rewrite_from_manifest(path, manifest, cfg.dry_run, result, task_err);
        },
        &progress);
    progress.finish();

    for (std::size_t i = 0; i < outcomes.size(); ++i)
    {
        const auto &outcome = outcomes[i];
        if (!outcome.ok)
        {
            report.failed_files.push_back(targets[i]);
            continue;
        }
        report.malformed += outcome.result.malformed;
        if (outcome.result.removed == 0)
        {
            continue;
        }
        report.removed += outcome.result.removed;
        if (outcome.result.replaced)
        {
            ++report.files_rewritten;
        }
        report.per_file.push_back({targets[i], outcome.result.removed});
    }
    report.seconds = detail::seconds_since(start);

    std::ostream &out = std::cout;
    for (const auto &f : report.per_file)
    {
        out << (cfg.dry_run ? "Would remove " : "Removed ") << f.removed << " entries from " << f.path << "\n";
    }
    out << "\n--- Removal Summary ---\n";
    out << "Files processed: " << targets.size() - report.failed_files.size() << "\n";
    out << "Files modified: " << report.files_rewritten << "\n";
    out << "Entries removed: " << report.removed << "\n";
    out << "Expected removals: " << report.expected_removals << "\n";
    if (report.malformed > 0)
    {
        out << "Unparsable lines kept: " << report.malformed << "\n";
    }
    out.setf(std::ios::fixed);
    out << "Completed in " << std::setprecision(1) << report.seconds << "s\n";

    if (!report.missing_files.empty())
    {
        std::cerr << "Warning: " << report.missing_files.size() << " manifest files not found under "
                  << cfg.input_dir << ":\n";
        for (const auto &name : report.missing_files)
        {
            std::cerr << "  - " << name << "\n";
        }
    }
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
