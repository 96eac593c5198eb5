#pragma once

#include <string>
#include <vector>

#include "corpusflux/cleaning_stats.hpp"
#include "corpusflux/jsonl_io.hpp"
#include "corpusflux/pattern_rules.hpp"

namespace corpusflux
{

struct TransformOptions
{
    std::string text_field = "content_text";
    std::string meta_field = "meta_tags";
};

enum class LineAction
{
    write = 0,
    drop
};

// Absent, null, blank string or empty array.
bool is_meta_tags_empty(const Record &record, const std::string &meta_field);

class RecordTransformer
{
  public:
    explicit RecordTransformer(TransformOptions options = {});
    RecordTransformer(TransformOptions options, std::vector<PatternRule> rules);

    // Cleans one text value, adding per-rule reductions to stats.
    std::string clean_text(const std::string &text, CleaningStats &stats) const;

    // out_line is only meaningful when the result is LineAction::write.
    LineAction transform_line(const std::string &line, const std::string &source_label, std::string &out_line,
                              CleaningStats &stats) const;

    // Streams input into output (staged through "<output>.tmp"). stats receives this file's counters.
    bool transform_file(const std::string &input_path, const std::string &output_path, CleaningStats &stats,
                        std::string &err) const;

    const TransformOptions &options() const { return options_; }

  private:
    TransformOptions options_;
    std::vector<PatternRule> rules_;
};

} // namespace corpusflux
