#include "corpusflux/record_transformer.hpp"

#include <iostream>
#include <utility>

#include "corpusflux/progress.hpp"

namespace corpusflux
{

namespace
{
constexpr std::size_t kLogPreviewBytes = 100;
}

bool is_meta_tags_empty(const Record &record, const std::string &meta_field)
{
    auto it = record.find(meta_field);
    if (it == record.end() || it->is_null())
    {
        return true;
    }
    if (it->is_string())
    {
        return trim_whitespace(it->get_ref<const std::string &>()).empty();
    }
    if (it->is_array())
    {
        return it->empty();
    }
    return false;
}

RecordTransformer::RecordTransformer(TransformOptions options)
    : RecordTransformer(std::move(options), default_pattern_rules())
{
}

RecordTransformer::RecordTransformer(TransformOptions options, std::vector<PatternRule> rules)
    : options_(std::move(options)), rules_(std::move(rules))
{
}

std::string RecordTransformer::clean_text(const std::string &text, CleaningStats &stats) const
{
    return trim_whitespace(apply_pattern_rules(rules_, text, stats));
}

LineAction RecordTransformer::transform_line(const std::string &line, const std::string &source_label,
                                             std::string &out_line, CleaningStats &stats) const
{
    ++stats.records_read;
    ParsedLine parsed = parse_record_line(line, options_.text_field);
    switch (parsed.kind)
    {
    case LineKind::parse_error:
        ++stats.parse_errors;
        ++stats.records_written;
        print_line(std::cerr, "Error processing line in " + source_label + ": " + parsed.error +
                                  "\nLine: " + line.substr(0, kLogPreviewBytes) + "...");
        out_line = std::move(parsed.raw);
        return LineAction::write;
    case LineKind::pass_through:
        ++stats.records_passed_through;
        ++stats.records_written;
        out_line = std::move(parsed.raw);
        return LineAction::write;
    case LineKind::parsed:
        break;
    }

    auto &field = parsed.record[options_.text_field];
    const std::string &original = field.get_ref<const std::string &>();
    stats.size_before += original.size();
    std::string cleaned = clean_text(original, stats);
    const std::size_t cleaned_size = cleaned.size();
    field = std::move(cleaned);

    if (cleaned_size == 0 && is_meta_tags_empty(parsed.record, options_.meta_field))
    {
        ++stats.records_dropped;
        return LineAction::drop;
    }

    stats.size_after += cleaned_size;
    ++stats.records_written;
    out_line = dump_record(parsed.record);
    return LineAction::write;
}

bool RecordTransformer::transform_file(const std::string &input_path, const std::string &output_path,
                                       CleaningStats &stats, std::string &err) const
{
    stats = {};
    const std::string label = base_name(input_path);

    StagedFile out(output_path);
    if (!out.open(err))
    {
        return false;
    }

    bool write_ok = true;
    std::string out_line;
    bool read_ok = read_text_lines(
        input_path,
        [&](const std::string &line) {
            if (line.empty())
            {
                return true;
            }
            if (transform_line(line, label, out_line, stats) == LineAction::drop)
            {
                return true;
            }
            if (!out.write_line(out_line))
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
    if (!out.commit(err))
    {
        return false;
    }
    stats.processed_files = 1;
    return true;
}

} // namespace corpusflux
