#include "corpusflux/pattern_rules.hpp"

#include <cstdint>
#include <string_view>

namespace corpusflux
{

namespace
{
// U+3000 and U+FFFD in UTF-8.
constexpr std::string_view kIdeographicSpace = "\xE3\x80\x80";
constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";
constexpr std::size_t kMaxReferenceDigits = 6;

bool starts_with_at(const std::string &s, std::size_t i, std::string_view seq)
{
    return i + seq.size() <= s.size() && std::string_view(s).substr(i, seq.size()) == seq;
}

bool is_digit(unsigned char c)
{
    return c >= '0' && c <= '9';
}

bool is_hex(unsigned char c)
{
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool is_ascii_alnum(unsigned char c)
{
    return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Decodes one well-formed multi-byte sequence at s[i]; returns its length, or 0.
std::size_t decode_multibyte(const std::string &s, std::size_t i, std::uint32_t &cp)
{
    unsigned char c = static_cast<unsigned char>(s[i]);
    std::size_t len = 0;
    if ((c >> 5) == 0x6)
    {
        len = 2;
        cp = c & 0x1F;
    }
    else if ((c >> 4) == 0xE)
    {
        len = 3;
        cp = c & 0x0F;
    }
    else if ((c >> 3) == 0x1E)
    {
        len = 4;
        cp = c & 0x07;
    }
    else
    {
        return 0;
    }
    if (i + len > s.size())
    {
        return 0;
    }
    for (std::size_t k = 1; k < len; ++k)
    {
        unsigned char cc = static_cast<unsigned char>(s[i + k]);
        if ((cc >> 6) != 0x2)
        {
            return 0;
        }
        cp = (cp << 6) | (cc & 0x3F);
    }
    return len;
}

bool is_unicode_space(std::uint32_t cp)
{
    return cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 || cp == 0x2029 ||
           cp == 0x202F || cp == 0x205F || cp == 0x3000 || cp == 0xFEFF;
}

// Position of the first line terminator (\n, \r, U+2028, U+2029) at or after i.
std::size_t line_end(const std::string &s, std::size_t i)
{
    for (; i < s.size(); ++i)
    {
        char c = s[i];
        if (c == '\n' || c == '\r' || starts_with_at(s, i, "\xE2\x80\xA8") || starts_with_at(s, i, "\xE2\x80\xA9"))
        {
            return i;
        }
    }
    return s.size();
}

// Length of the character reference starting at s[i] == '&', or 0.
std::size_t entity_length(const std::string &s, std::size_t i)
{
    const std::size_t n = s.size();
    std::size_t j = i + 1;
    if (j < n && s[j] == '#')
    {
        std::size_t k = j + 1;
        bool hex = false;
        if (k < n && (s[k] == 'x' || s[k] == 'X'))
        {
            hex = true;
            ++k;
        }
        const std::size_t digits_start = k;
        while (k < n && k - digits_start < kMaxReferenceDigits &&
               (hex ? is_hex(static_cast<unsigned char>(s[k])) : is_digit(static_cast<unsigned char>(s[k]))))
        {
            ++k;
        }
        if (k > digits_start && k < n && s[k] == ';')
        {
            return k + 1 - i;
        }
        return 0;
    }
    std::size_t k = j;
    while (k < n && is_ascii_alnum(static_cast<unsigned char>(s[k])))
    {
        ++k;
    }
    if (k > j && k < n && s[k] == ';')
    {
        return k + 1 - i;
    }
    return 0;
}

bool is_query_stop(const std::string &s, std::size_t i)
{
    char c = s[i];
    return c == '"' || c == '\'' || c == '<' || c == '>' || whitespace_length(s, i) > 0;
}
} // namespace

std::size_t whitespace_length(const std::string &text, std::size_t i)
{
    if (i >= text.size())
    {
        return 0;
    }
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (c < 0x80)
    {
        return (c == ' ' || (c >= 0x09 && c <= 0x0D)) ? 1 : 0;
    }
    std::uint32_t cp = 0;
    std::size_t len = decode_multibyte(text, i, cp);
    return (len > 0 && is_unicode_space(cp)) ? len : 0;
}

std::string collapse_spaces(const std::string &text)
{
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size())
    {
        std::size_t j = i;
        while (j < text.size())
        {
            if (text[j] == ' ' || text[j] == '\t')
            {
                ++j;
            }
            else if (starts_with_at(text, j, kIdeographicSpace))
            {
                j += kIdeographicSpace.size();
            }
            else
            {
                break;
            }
        }
        if (j > i)
        {
            out.push_back(' ');
            i = j;
            continue;
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::string strip_tags(const std::string &text)
{
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size())
    {
        if (text[i] == '<')
        {
            std::size_t close = text.find('>', i + 1);
            if (close == std::string::npos)
            {
                out.append(text, i, std::string::npos);
                break;
            }
            if (close > i + 1)
            {
                i = close + 1;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::string strip_entities(const std::string &text)
{
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size())
    {
        if (text[i] == '&')
        {
            std::size_t len = entity_length(text, i);
            if (len > 0)
            {
                i += len;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::string strip_control_chars(const std::string &text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
    {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c <= 0x08 || (c >= 0x0B && c <= 0x1F) || c == 0x7F)
        {
            continue;
        }
        out.push_back(ch);
    }
    return out;
}

std::string strip_replacement_chars(const std::string &text)
{
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size())
    {
        if (starts_with_at(text, i, kReplacementChar))
        {
            i += kReplacementChar.size();
            continue;
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::string unwrap_markdown_links(const std::string &text)
{
    std::string out;
    out.reserve(text.size());
    const std::string_view view(text);
    std::size_t eol = 0;
    std::size_t i = 0;
    while (i < text.size())
    {
        if (text[i] != '[')
        {
            out.push_back(text[i]);
            ++i;
            continue;
        }
        if (i >= eol)
        {
            eol = line_end(text, i);
        }
        std::size_t mid = view.substr(i + 1, eol - i - 1).find("](");
        if (mid != std::string_view::npos)
        {
            mid += i + 1;
            std::size_t close = view.substr(mid + 2, eol - mid - 2).find(')');
            if (close != std::string_view::npos)
            {
                out.append(text, i + 1, mid - i - 1);
                i = mid + 2 + close + 1;
                continue;
            }
        }
        // Nothing later on this line can complete a link either.
        out.append(text, i, eol - i);
        i = eol;
    }
    return out;
}

std::string strip_query_suffixes(const std::string &text)
{
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size())
    {
        if (text[i] == '?')
        {
            std::size_t j = i + 1;
            while (j < text.size() && !is_query_stop(text, j))
            {
                ++j;
            }
            if (j > i + 1)
            {
                i = j;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::string collapse_line_breaks(const std::string &text)
{
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size())
    {
        if (text[i] != '\n')
        {
            out.push_back(text[i]);
            ++i;
            continue;
        }
        std::size_t j = i;
        while (j < text.size() && text[j] == '\n')
        {
            ++j;
        }
        out.append(j - i >= 3 ? 2 : j - i, '\n');
        i = j;
    }
    return out;
}

const std::vector<PatternRule> &default_pattern_rules()
{
    static const std::vector<PatternRule> rules = {
        {"spaces", collapse_spaces},
        {"tags", strip_tags},
        {"entities", strip_entities},
        {"controlChars", strip_control_chars},
        {"unicodeReplacement", strip_replacement_chars},
        {"markdown", unwrap_markdown_links},
        {"urls", strip_query_suffixes},
        {"extraLineBreaks", collapse_line_breaks},
    };
    return rules;
}

std::string apply_pattern_rules(const std::vector<PatternRule> &rules, std::string text, CleaningStats &stats)
{
    for (const auto &rule : rules)
    {
        const std::size_t before = text.size();
        text = rule.rewrite(text);
        if (text.size() < before)
        {
            stats.rule_bytes_reduced[rule.name] += before - text.size();
        }
    }
    return text;
}

std::string trim_whitespace(const std::string &text)
{
    auto is_ws = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f'; };
    std::size_t start = 0;
    while (start < text.size() && is_ws(text[start]))
    {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && is_ws(text[end - 1]))
    {
        --end;
    }
    return text.substr(start, end - start);
}

} // namespace corpusflux
