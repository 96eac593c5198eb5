#include "corpusflux/config.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace corpusflux
{

namespace
{
std::string trim(const std::string &s)
{
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
    {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    {
        --end;
    }
    return s.substr(start, end - start);
}

std::size_t parse_size(const std::string &s, std::size_t def_val)
{
    try
    {
        return static_cast<std::size_t>(std::stoull(s));
    }
    catch (const std::exception &)
    {
        return def_val;
    }
}

bool parse_bool(const std::string &s, bool def_val)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
    {
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on")
    {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off")
    {
        return false;
    }
    return def_val;
}

bool parse_size_arg(const std::string &s, std::size_t &out)
{
    try
    {
        std::size_t pos = 0;
        unsigned long long v = std::stoull(s, &pos, 10);
        if (pos != s.size() || s.empty() || s[0] == '-')
        {
            return false;
        }
        if (v > static_cast<unsigned long long>(std::numeric_limits<std::size_t>::max()))
        {
            return false;
        }
        out = static_cast<std::size_t>(v);
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}
} // namespace

const char *stage_name(StageKind stage)
{
    switch (stage)
    {
    case StageKind::clean:
        return "CorpusFluxClean";
    case StageKind::select:
        return "CorpusFluxLargest";
    case StageKind::remove:
        return "CorpusFluxRemove";
    }
    return "corpusflux";
}

std::unordered_map<std::string, std::string> read_env_file(const std::string &path)
{
    std::unordered_map<std::string, std::string> env;
    std::ifstream in(path);
    if (!in)
    {
        return env;
    }
    bool first_line = true;
    std::string line;
    while (std::getline(in, line))
    {
        if (first_line)
        {
            first_line = false;
            if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
                static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF)
            {
                line.erase(0, 3);
            }
        }
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#')
        {
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        std::string key = trim(trimmed.substr(0, eq));
        std::string val = trim(trimmed.substr(eq + 1));
        if (val.size() >= 2 &&
            ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\'')))
        {
            val = val.substr(1, val.size() - 2);
        }
        env[key] = val;
    }
    return env;
}

void apply_env_overrides(Config &cfg, const std::unordered_map<std::string, std::string> &env)
{
    auto get = [&](const std::string &key) -> const std::string * {
        auto it = env.find(key);
        if (it == env.end())
        {
            return nullptr;
        }
        return &it->second;
    };
    if (auto v = get("INPUT_DIR"))
        cfg.input_dir = *v;
    if (auto v = get("OUTPUT_DIR"))
        cfg.output_dir = *v;
    if (auto v = get("MANIFEST_PATH"))
        cfg.manifest_path = *v;
    if (auto v = get("TEXT_FIELD"))
        cfg.text_field = *v;
    if (auto v = get("META_FIELD"))
        cfg.meta_field = *v;
    if (auto v = get("TOP_N"))
        cfg.top_n = parse_size(*v, cfg.top_n);
    if (auto v = get("THREADS"))
        cfg.threads = parse_size(*v, cfg.threads);
    if (auto v = get("WAVE_FILES"))
        cfg.wave_files = parse_size(*v, cfg.wave_files);
    if (auto v = get("SUMMARY_TOP"))
        cfg.summary_top = parse_size(*v, cfg.summary_top);
    if (auto v = get("PROGRESS_INTERVAL_MS"))
        cfg.progress_interval_ms = parse_size(*v, cfg.progress_interval_ms);
    if (auto v = get("RESUME"))
        cfg.resume = parse_bool(*v, cfg.resume);
    if (auto v = get("DRY_RUN"))
        cfg.dry_run = parse_bool(*v, cfg.dry_run);
}

std::string detect_env_path_arg(int argc, char **argv, const std::string &fallback)
{
    for (int i = 1; i + 1 < argc; ++i)
    {
        if (std::string(argv[i]) == "--env-file")
        {
            return argv[i + 1];
        }
    }
    return fallback;
}

void print_usage(StageKind stage)
{
    std::cerr << stage_name(stage) << ": ";
    switch (stage)
    {
    case StageKind::clean:
        std::cerr << "strip markup noise from the text field of every record under a JSONL partition tree\n";
        break;
    case StageKind::select:
        std::cerr << "find the largest records across a JSONL partition tree and write a removal manifest\n";
        break;
    case StageKind::remove:
        std::cerr << "remove the records named by a manifest from their source files in place\n";
        break;
    }
    std::cerr << "Usage:\n"
              << "  " << stage_name(stage) << " [input_dir] [options]\n\n"
              << "Options:\n"
              << "  --env-file <path>             Path to .env (default: .env)\n"
              << "  --input <dir>                 Input directory (default: analyses)\n"
              << "  --threads <n>                 Worker threads (0=auto)\n"
              << "  --text-field <name>           JSON text field (default: content_text)\n"
              << "  --progress-interval-ms <n>    Progress print interval (default: 1000)\n";
    switch (stage)
    {
    case StageKind::clean:
        std::cerr << "  --output-dir <dir>            Output directory (default: analyses_cleaned)\n"
                  << "  --meta-field <name>           JSON meta tags field (default: meta_tags)\n"
                  << "  --resume / --no-resume        Skip files whose output is newer (default: on)\n";
        break;
    case StageKind::select:
        std::cerr << "  --manifest <path>             Output manifest (default: largest_content.jsonl)\n"
                  << "  --top-n <n>                   Entries to keep (default: 1000)\n"
                  << "  --wave-files <n>              Files per wave (0=max(5, threads/2))\n"
                  << "  --summary-top <n>             Entries printed in the summary (default: 5)\n"
                  << "Lengths are UTF-8 byte counts of the text field, not UTF-16 code units or characters.\n";
        break;
    case StageKind::remove:
        std::cerr << "  --manifest <path>             Input manifest (default: largest_content.jsonl)\n"
                  << "  --dry-run                     Count removals without rewriting files\n";
        break;
    }
    std::cerr << "  --help                        Show this help\n";
}

bool parse_stage_args(int argc, char **argv, StageKind stage, Config &cfg, std::string &err, bool &show_help)
{
    show_help = false;
    bool have_positional = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto need_value = [&](const std::string &name, std::string &out) -> bool {
            if (i + 1 >= argc)
            {
                err = "Missing value for " + name;
                return false;
            }
            out = argv[++i];
            return true;
        };
        auto need_size = [&](const std::string &name, std::size_t &out) -> bool {
            std::string v;
            if (!need_value(name, v))
            {
                return false;
            }
            if (!parse_size_arg(v, out))
            {
                err = "Invalid " + name + ": " + v;
                return false;
            }
            return true;
        };

        if (arg == "--help" || arg == "-h")
        {
            show_help = true;
            return false;
        }
        if (arg == "--")
        {
            continue;
        }
        if (arg == "--env-file")
        {
            if (!need_value(arg, cfg.env_path))
            {
                return false;
            }
            continue;
        }
        if (arg == "--input")
        {
            if (!need_value(arg, cfg.input_dir))
            {
                return false;
            }
            continue;
        }
        if (arg == "--threads")
        {
            if (!need_size(arg, cfg.threads))
            {
                return false;
            }
            continue;
        }
        if (arg == "--text-field")
        {
            if (!need_value(arg, cfg.text_field))
            {
                return false;
            }
            continue;
        }
        if (arg == "--progress-interval-ms")
        {
            if (!need_size(arg, cfg.progress_interval_ms))
            {
                return false;
            }
            continue;
        }
        if (stage == StageKind::clean)
        {
            if (arg == "--output-dir")
            {
                if (!need_value(arg, cfg.output_dir))
                {
                    return false;
                }
                continue;
            }
            if (arg == "--meta-field")
            {
                if (!need_value(arg, cfg.meta_field))
                {
                    return false;
                }
                continue;
            }
            if (arg == "--resume")
            {
                cfg.resume = true;
                continue;
            }
            if (arg == "--no-resume")
            {
                cfg.resume = false;
                continue;
            }
        }
        if (stage == StageKind::select || stage == StageKind::remove)
        {
            if (arg == "--manifest")
            {
                if (!need_value(arg, cfg.manifest_path))
                {
                    return false;
                }
                continue;
            }
        }
        if (stage == StageKind::select)
        {
            if (arg == "--top-n")
            {
                if (!need_size(arg, cfg.top_n))
                {
                    return false;
                }
                continue;
            }
            if (arg == "--wave-files")
            {
                if (!need_size(arg, cfg.wave_files))
                {
                    return false;
                }
                continue;
            }
            if (arg == "--summary-top")
            {
                if (!need_size(arg, cfg.summary_top))
                {
                    return false;
                }
                continue;
            }
        }
        if (stage == StageKind::remove && arg == "--dry-run")
        {
            cfg.dry_run = true;
            continue;
        }
        if (!arg.empty() && arg[0] == '-')
        {
            err = "Unknown option: " + arg;
            return false;
        }
        if (have_positional)
        {
            err = "Unexpected argument: " + arg;
            return false;
        }
        cfg.input_dir = arg;
        have_positional = true;
    }
    return true;
}

bool load_stage_config(int argc, char **argv, StageKind stage, Config &cfg, std::string &err, bool &show_help)
{
    cfg.env_path = detect_env_path_arg(argc, argv, cfg.env_path);
    auto env = read_env_file(cfg.env_path);
    apply_env_overrides(cfg, env);
    return parse_stage_args(argc, argv, stage, cfg, err, show_help);
}

} // namespace corpusflux
