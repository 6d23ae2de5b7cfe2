#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

/**
 * The download target, opened once and shared by all segment workers.
 *
 * Writes are positional (pwrite), so workers writing disjoint ranges need
 * no lock. Owns the file descriptor (RAII).
 */
class OutputFile
{
public:
    /**
     * Open (creating if needed) without truncating.
     * @throws FileWriteError if the file cannot be opened
     */
    explicit OutputFile(const std::filesystem::path &path);
    ~OutputFile();

    OutputFile(const OutputFile &) = delete;
    OutputFile &operator=(const OutputFile &) = delete;

    /**
     * Set the on-disk length. Growing leaves a sparse hole where the
     * filesystem supports it; shrinking discards the tail.
     */
    void resize(std::uint64_t size);

    // Write all of [data, data+size) at offset; short writes are retried
    void writeAt(std::uint64_t offset, const char *data, std::size_t size);

    // Flush file data to disk before a checkpoint refers to it
    void sync();

    std::uint64_t size() const;
    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
};
