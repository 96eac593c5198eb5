#pragma once

#include <cstdint>
#include <set>
#include <string>

#include "corpusflux/top_k.hpp"

namespace corpusflux
{

struct RewriteResult
{
    bool manifest_hit = false;
    bool replaced = false; // original was swapped for the filtered copy
    std::uint64_t removed = 0;
    std::uint64_t kept = 0;
    std::uint64_t malformed = 0;
};

// Streams path into "<path>.tmp" leaving out records whose url is in exclude.
// Lines that do not parse are kept verbatim. The temp file replaces the
// original only when something was removed and dry_run is false; otherwise the
// original is left untouched.
bool rewrite_excluding(const std::string &path, const std::set<std::string> &exclude, bool dry_run,
                       RewriteResult &result, std::string &err);

// Looks path up in manifest by base name; files without an entry are not opened.
bool rewrite_from_manifest(const std::string &path, const RemovalManifest &manifest, bool dry_run,
                           RewriteResult &result, std::string &err);

} // namespace corpusflux
