#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "corpusflux/cleaning_stats.hpp"

namespace corpusflux
{

// One named rewrite step. Every built-in rule is a single forward scan over the
// UTF-8 bytes, so running time and stack use do not depend on match length.
struct PatternRule
{
    std::string name;
    std::function<std::string(const std::string &)> rewrite;
};

// Rule order matters: every rule runs on the output of the previous one.
//   spaces, tags, entities, controlChars, unicodeReplacement, markdown, urls, extraLineBreaks
const std::vector<PatternRule> &default_pattern_rules();

// Applies rules in order; the length removed by each rule is added to stats.rule_bytes_reduced.
std::string apply_pattern_rules(const std::vector<PatternRule> &rules, std::string text, CleaningStats &stats);

// Runs of space, tab or U+3000 become one space.
std::string collapse_spaces(const std::string &text);
// Removes "<...>" spans with at least one byte between the brackets.
std::string strip_tags(const std::string &text);
// Removes "&name;", "&#123;" and "&#x1F;" references (case-insensitive, up to 6 digits).
std::string strip_entities(const std::string &text);
// Removes bytes 0x00-0x08, 0x0B-0x1F and 0x7F.
std::string strip_control_chars(const std::string &text);
// Removes U+FFFD.
std::string strip_replacement_chars(const std::string &text);
// "[text](url)" becomes "text"; neither part may cross a line terminator.
std::string unwrap_markdown_links(const std::string &text);
// Removes "?..." up to the next quote, angle bracket or whitespace character.
std::string strip_query_suffixes(const std::string &text);
// Three or more consecutive newlines become exactly two.
std::string collapse_line_breaks(const std::string &text);

// Byte length of the whitespace character starting at text[i], or 0. Covers ASCII
// whitespace and the Unicode space separators (U+00A0, U+1680, U+2000-U+200A,
// U+2028, U+2029, U+202F, U+205F, U+3000, U+FEFF).
std::size_t whitespace_length(const std::string &text, std::size_t i);

std::string trim_whitespace(const std::string &text);

} // namespace corpusflux
