#pragma once

#include <fstream>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace corpusflux
{

// Field order of every record is preserved from input to output.
using Record = nlohmann::ordered_json;

enum class LineKind
{
    parsed = 0,   // JSON object whose text field is a string
    pass_through, // valid JSON, but not an object or no string text field
    parse_error
};

struct ParsedLine
{
    LineKind kind = LineKind::parse_error;
    Record record; // set for parsed, and for pass_through objects
    std::string raw;
    std::string error;
};

ParsedLine parse_record_line(const std::string &line, const std::string &text_field);

std::string dump_record(const Record &record);

std::string base_name(const std::string &path);

// Calls cb for every line with the trailing CR stripped; cb returns false to stop early.
// Returns false if the file cannot be opened or a read error occurs.
bool read_text_lines(const std::string &path, const std::function<bool(const std::string &)> &cb, std::string &err);

// Moves from over to, falling back to copy_replace_file when rename fails.
bool replace_file(const std::string &from, const std::string &to, std::string &err);

// Copies from over to, then deletes from. If the copy fails, from is kept and its
// path is reported in err.
bool copy_replace_file(const std::string &from, const std::string &to, std::string &err);

// Output written to "<target>.tmp" and moved over target on commit().
// The temp file is removed if the object is destroyed without a successful commit.
class StagedFile
{
  public:
    explicit StagedFile(std::string target);
    ~StagedFile();

    StagedFile(const StagedFile &) = delete;
    StagedFile &operator=(const StagedFile &) = delete;

    bool open(std::string &err);
    bool write_line(const std::string &line);
    bool commit(std::string &err);
    void discard();

    const std::string &temp_path() const { return temp_path_; }

  private:
    std::string target_;
    std::string temp_path_;
    std::vector<char> buffer_;
    std::ofstream out_;
    bool opened_ = false;
    bool done_ = false;
};

} // namespace corpusflux
