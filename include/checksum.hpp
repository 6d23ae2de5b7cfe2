#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

/**
 * SHA-256 of a finished download, and the check against a user-supplied
 * "sha256:<hex>" value. The file is streamed, never loaded whole.
 */
class ChecksumVerifier
{
public:
    /**
     * Digest a file on disk.
     *
     * @param filePath File to read from start to end
     * @param cancelled Polled between chunks; returning true stops hashing
     * @return 64 lower-case hex characters
     * @throws FileReadError if the file is missing or a read fails
     * @throws CancelledError when `cancelled` turned true
     */
    static std::string computeSHA256(const std::filesystem::path &filePath,
                                     const std::function<bool()> &cancelled = nullptr);

    /**
     * True when the file's digest equals `expectedChecksum`.
     * Case, whitespace and ':'/'-' separators in the hex part do not matter.
     *
     * @throws std::invalid_argument if `expectedChecksum` is malformed
     * @throws FileReadError if the file cannot be read
     */
    static bool verify(const std::filesystem::path &filePath, const std::string &expectedChecksum);

    /**
     * Validate "sha256:<hex>" and return the normalized hex part.
     * @throws std::invalid_argument for another algorithm, bad characters or wrong length
     */
    static std::string parseChecksum(const std::string &checksumStr);

private:
    // Lower-case hex with separators dropped; throws on a non-hex character
    static std::string normalizeHex(const std::string &hex);

    static constexpr std::size_t CHUNK_SIZE = 1024 * 1024; // Bytes per read
};
