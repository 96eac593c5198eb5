#include "corpusflux/jsonl_io.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

#include "corpusflux/progress.hpp"

namespace corpusflux
{

namespace
{
constexpr std::size_t kWriteBufferBytes = 64 * 1024;
}

ParsedLine parse_record_line(const std::string &line, const std::string &text_field)
{
    ParsedLine out;
    try
    {
        out.record = Record::parse(line);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        out.kind = LineKind::parse_error;
        out.raw = line;
        out.error = e.what();
        return out;
    }
    if (!out.record.is_object())
    {
        out.kind = LineKind::pass_through;
        out.raw = line;
        return out;
    }
    auto it = out.record.find(text_field);
    if (it == out.record.end() || !it->is_string())
    {
        out.kind = LineKind::pass_through;
        out.raw = line;
        return out;
    }
    out.kind = LineKind::parsed;
    return out;
}

std::string dump_record(const Record &record)
{
    return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string base_name(const std::string &path)
{
    return std::filesystem::path(path).filename().string();
}

bool read_text_lines(const std::string &path, const std::function<bool(const std::string &)> &cb, std::string &err)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        err = "failed to open: " + path;
        return false;
    }
    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (!cb(line))
        {
            return true;
        }
    }
    if (in.bad())
    {
        err = "read error: " + path;
        return false;
    }
    return true;
}

bool replace_file(const std::string &from, const std::string &to, std::string &err)
{
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec)
    {
        return true;
    }
    if (!copy_replace_file(from, to, err))
    {
        err += " (rename: " + ec.message() + ")";
        return false;
    }
    return true;
}

bool copy_replace_file(const std::string &from, const std::string &to, std::string &err)
{
    std::error_code ec;
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec)
    {
        err = "failed to replace " + to + ": copy: " + ec.message() + "; staged output kept at " + from;
        return false;
    }
    std::filesystem::remove(from, ec);
    if (ec)
    {
        print_line(std::cerr, "Warning: could not remove " + from + ": " + ec.message());
    }
    return true;
}

StagedFile::StagedFile(std::string target) : target_(std::move(target)), temp_path_(target_ + ".tmp") {}

StagedFile::~StagedFile()
{
    discard();
}

bool StagedFile::open(std::string &err)
{
    buffer_.resize(kWriteBufferBytes);
    out_.rdbuf()->pubsetbuf(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    out_.open(temp_path_, std::ios::binary | std::ios::trunc);
    if (!out_)
    {
        err = "failed to create: " + temp_path_;
        return false;
    }
    opened_ = true;
    return true;
}

bool StagedFile::write_line(const std::string &line)
{
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    out_.put('\n');
    return static_cast<bool>(out_);
}

bool StagedFile::commit(std::string &err)
{
    if (!opened_ || done_)
    {
        err = "staged file not open: " + temp_path_;
        return false;
    }
    out_.flush();
    out_.close();
    if (out_.fail())
    {
        err = "failed to write: " + temp_path_;
        discard();
        return false;
    }
    if (!replace_file(temp_path_, target_, err))
    {
        done_ = true;
        return false;
    }
    done_ = true;
    return true;
}

void StagedFile::discard()
{
    if (done_ || !opened_)
    {
        return;
    }
    if (out_.is_open())
    {
        out_.close();
    }
    std::error_code ec;
    std::filesystem::remove(temp_path_, ec);
    done_ = true;
}

} // namespace corpusflux
