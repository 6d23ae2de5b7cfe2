#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "segment.hpp"

/**
 * Persisted per-segment progress of one download.
 * A segment whose bytesWritten equals its length is Done.
 */
struct ResumeRecord
{
    std::string url;
    std::uint64_t totalSize = 0;
    std::vector<Segment> segments;

    // Rebuild a record from the coordinator's live segment table
    static ResumeRecord fromSegments(const std::string &url, std::uint64_t totalSize,
                                     const std::vector<Segment> &segments);
};

/**
 * Reads and writes the resume sidecar that sits next to the output file.
 *
 * Sidecar format (one record per line, space separated):
 *
 *     swiftdl-resume 1
 *     url <url>
 *     size <total bytes>
 *     segments <count>
 *     segment <index> <start> <end> <bytesWritten>
 */
class ResumeStore
{
public:
    static constexpr const char *SIDECAR_SUFFIX = ".swiftdl-resume";

    // "<output>.swiftdl-resume", in the output file's directory
    static std::filesystem::path sidecarPath(const std::filesystem::path &outputPath);

    /**
     * Load the sidecar if it exists, parses, describes a valid partition of
     * [0, totalSize) and was written for the same URL and size.
     * Any other outcome returns nullopt: the caller starts fresh. Never throws
     * for a bad sidecar.
     */
    static std::optional<ResumeRecord> load(const std::filesystem::path &sidecar,
                                            const std::string &url,
                                            std::uint64_t totalSize);

    /**
     * Replace the sidecar with `record` (write temp file, then rename).
     * Calling it twice with the same record leaves the same file.
     * @throws FileWriteError if the sidecar cannot be written
     */
    static void save(const std::filesystem::path &sidecar, const ResumeRecord &record);

    // Remove the sidecar; missing is fine
    static void clear(const std::filesystem::path &sidecar);

    // Text form of a record (what save() writes)
    static std::string serialize(const ResumeRecord &record);

    /**
     * Parse the text form.
     * @throws ResumeStateCorrupt on any syntax or consistency problem
     */
    static ResumeRecord parse(const std::string &text);
};
