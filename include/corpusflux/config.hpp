#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace corpusflux
{

enum class StageKind
{
    clean = 0,
    select,
    remove
};

struct Config
{
    std::string env_path = ".env";
    std::string input_dir = "analyses";
    std::string output_dir = "analyses_cleaned";
    std::string manifest_path = "largest_content.jsonl";
    std::string text_field = "content_text";
    std::string meta_field = "meta_tags";

    std::size_t top_n = 1000;
    std::size_t threads = 0;    // 0 -> auto
    std::size_t wave_files = 0; // 0 -> max(5, threads / 2)
    std::size_t summary_top = 5;
    std::size_t progress_interval_ms = 1000;

    bool resume = true;
    bool dry_run = false;
};

std::unordered_map<std::string, std::string> read_env_file(const std::string &path);
void apply_env_overrides(Config &cfg, const std::unordered_map<std::string, std::string> &env);

// Returns the value of --env-file if present, otherwise fallback.
std::string detect_env_path_arg(int argc, char **argv, const std::string &fallback);

void print_usage(StageKind stage);

// show_help is set when --help was requested; the caller should print usage and exit 0.
bool parse_stage_args(int argc, char **argv, StageKind stage, Config &cfg, std::string &err, bool &show_help);

// Defaults, then .env, then flags.
bool load_stage_config(int argc, char **argv, StageKind stage, Config &cfg, std::string &err, bool &show_help);

const char *stage_name(StageKind stage);

} // namespace corpusflux
