#include "corpusflux/safe_rewriter.hpp"

#include <iostream>

#include "corpusflux/jsonl_io.hpp"
#include "corpusflux/progress.hpp"

namespace corpusflux
{

bool rewrite_excluding(const std::string &path, const std::set<std::string> &exclude, bool dry_run,
                       RewriteResult &result, std::string &err)
{
    result.removed = 0;
    result.kept = 0;
    result.malformed = 0;
    result.replaced = false;

    StagedFile out(path);
    if (!out.open(err))
    {
        return false;
    }

    bool write_ok = true;
    bool read_ok = read_text_lines(
        path,
        [&](const std::string &line) {
            if (line.empty())
            {
                return true;
            }
            Record record;
            bool parsed = true;
            try
            {
                record = Record::parse(line);
            }
            catch (const nlohmann::json::parse_error &e)
            {
                parsed = false;
                ++result.malformed;
                print_line(std::cerr, "Keeping unparsable line in " + path + ": " + e.what());
            }
            if (parsed && record.is_object())
            {
                auto url = record.find("url");
                if (url != record.end() && url->is_string() &&
                    exclude.count(url->get_ref<const std::string &>()) > 0)
                {
                    ++result.removed;
                    return true;
                }
            }
            ++result.kept;
            // The original bytes are written back so untouched records stay byte-identical.
            if (!out.write_line(line))
            {
                write_ok = false;
                return false;
            }
            return true;
        },
        err);
    if (!read_ok)
    {
        return false;
    }
    if (!write_ok)
    {
        err = "failed to write: " + out.temp_path();
        return false;
    }

    if (result.removed == 0 || dry_run)
    {
        out.discard();
        return true;
    }
    if (!out.commit(err))
    {
        return false;
    }
    result.replaced = true;
    return true;
}

bool rewrite_from_manifest(const std::string &path, const RemovalManifest &manifest, bool dry_run,
                           RewriteResult &result, std::string &err)
{
    result = {};
    const std::set<std::string> *urls = manifest.urls_for(base_name(path));
    if (!urls)
    {
        return true;
    }
    result.manifest_hit = true;
    return rewrite_excluding(path, *urls, dry_run, result, err);
}

} // namespace corpusflux
