#include "resume_store.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include <fmt/core.h>

#include "errors.hpp"

namespace
{
    constexpr const char *MAGIC = "swiftdl-resume";
    constexpr int FORMAT_VERSION = 1;

    // Reads "<keyword> <rest of line>" and checks the keyword
    std::string expectLine(std::istream &in, const std::string &keyword)
    {
        std::string line;
        if (!std::getline(in, line))
        {
            throw ResumeStateCorrupt(fmt::format("Missing '{}' line", keyword));
        }
        if (line.rfind(keyword + " ", 0) != 0)
        {
            throw ResumeStateCorrupt(fmt::format("Expected '{}' line, got '{}'", keyword, line));
        }
        return line.substr(keyword.size() + 1);
    }

    std::uint64_t parseNumber(const std::string &text, const char *what)
    {
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
        {
            throw ResumeStateCorrupt(fmt::format("Invalid {}: '{}'", what, text));
        }
        try
        {
            return std::stoull(text);
        }
        catch (const std::exception &)
        {
            throw ResumeStateCorrupt(fmt::format("Invalid {}: '{}'", what, text));
        }
    }
} // namespace

ResumeRecord ResumeRecord::fromSegments(const std::string &url, std::uint64_t totalSize,
                                        const std::vector<Segment> &segments)
{
    ResumeRecord record;
    record.url = url;
    record.totalSize = totalSize;
    record.segments = segments;
    return record;
}

std::filesystem::path ResumeStore::sidecarPath(const std::filesystem::path &outputPath)
{
    std::filesystem::path sidecar = outputPath;
    sidecar += SIDECAR_SUFFIX;
    return sidecar;
}

std::string ResumeStore::serialize(const ResumeRecord &record)
{
    std::string text = fmt::format("{} {}\n", MAGIC, FORMAT_VERSION);
    text += fmt::format("url {}\n", record.url);
    text += fmt::format("size {}\n", record.totalSize);
    text += fmt::format("segments {}\n", record.segments.size());
    for (const auto &segment : record.segments)
    {
        text += fmt::format("segment {} {} {} {}\n", segment.index, segment.start, segment.end, segment.bytesWritten);
    }
    return text;
}

ResumeRecord ResumeStore::parse(const std::string &text)
{
    std::istringstream in(text);
    ResumeRecord record;

    std::string version = expectLine(in, MAGIC);
    if (version != std::to_string(FORMAT_VERSION))
    {
        throw ResumeStateCorrupt(fmt::format("Unsupported format version '{}'", version));
    }

    record.url = expectLine(in, "url");
    record.totalSize = parseNumber(expectLine(in, "size"), "size");
    std::uint64_t count = parseNumber(expectLine(in, "segments"), "segment count");

    for (std::uint64_t i = 0; i < count; ++i)
    {
        std::istringstream fields(expectLine(in, "segment"));
        std::string index, start, end, written, extra;
        if (!(fields >> index >> start >> end >> written) || (fields >> extra))
        {
            throw ResumeStateCorrupt(fmt::format("Malformed segment line {}", i));
        }

        Segment segment;
        segment.index = static_cast<std::size_t>(parseNumber(index, "segment index"));
        segment.start = parseNumber(start, "segment start");
        segment.end = parseNumber(end, "segment end");
        segment.bytesWritten = parseNumber(written, "bytes written");

        if (segment.end < segment.start || segment.bytesWritten > segment.length())
        {
            throw ResumeStateCorrupt(fmt::format("Inconsistent segment {}", segment.index));
        }
        segment.status = segment.isComplete() ? SegmentStatus::Done : SegmentStatus::Pending;
        record.segments.push_back(segment);
    }

    std::string trailing;
    while (std::getline(in, trailing))
    {
        if (!trailing.empty())
        {
            throw ResumeStateCorrupt("Unexpected data after last segment");
        }
    }

    if (!SegmentPlanner::isPartition(record.segments, record.totalSize))
    {
        throw ResumeStateCorrupt("Segments do not cover the file exactly");
    }

    return record;
}

std::optional<ResumeRecord> ResumeStore::load(const std::filesystem::path &sidecar,
                                              const std::string &url,
                                              std::uint64_t totalSize)
{
    std::error_code ec;
    if (!std::filesystem::exists(sidecar, ec))
    {
        return std::nullopt;
    }

    std::ifstream in(sidecar, std::ios::binary);
    if (!in)
    {
        fmt::print(stderr, "Warning: Cannot read resume file {}. Starting fresh download.\n", sidecar.string());
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    ResumeRecord record;
    try
    {
        record = parse(contents.str());
    }
    catch (const ResumeStateCorrupt &e)
    {
        fmt::print(stderr, "Warning: Ignoring corrupt resume file {} ({}). Starting fresh download.\n",
                   sidecar.string(), e.what());
        return std::nullopt;
    }

    if (record.url != url || record.totalSize != totalSize)
    {
        fmt::print(stderr, "Warning: Resume file {} belongs to a different download. Starting fresh download.\n",
                   sidecar.string());
        return std::nullopt;
    }

    return record;
}

void ResumeStore::save(const std::filesystem::path &sidecar, const ResumeRecord &record)
{
    std::filesystem::path tempPath = sidecar;
    tempPath += ".tmp";

    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            throw FileWriteError("ResumeStore", fmt::format("Cannot open resume file for writing: {}", tempPath.string()));
        }
        out << serialize(record);
        out.flush();
        if (!out.good())
        {
            throw FileWriteError("ResumeStore", fmt::format("Failed writing resume file: {}", tempPath.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, sidecar, ec);
    if (ec)
    {
        throw FileWriteError("ResumeStore", fmt::format("Cannot replace resume file {}: {}", sidecar.string(), ec.message()));
    }
}

void ResumeStore::clear(const std::filesystem::path &sidecar)
{
    std::error_code ec;
    std::filesystem::remove(sidecar, ec);
    if (ec)
    {
        fmt::print(stderr, "Warning: Could not remove resume file {}: {}\n", sidecar.string(), ec.message());
    }
}
