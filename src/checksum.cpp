#include "checksum.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>

// OpenSSL EVP digest interface
#include <openssl/evp.h>

#include "errors.hpp"

namespace
{
    constexpr std::size_t SHA256_HEX_LENGTH = 64; // 256 bits / 4 bits per hex digit

    struct DigestContextDeleter
    {
        void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
    };

    using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;
} // namespace

std::string ChecksumVerifier::computeSHA256(const std::filesystem::path &filePath,
                                            const std::function<bool()> &cancelled)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw FileReadError("Hasher", fmt::format("Cannot open file for checksum: {}", filePath.string()));
    }

    DigestContext context(EVP_MD_CTX_new());
    if (!context)
    {
        throw std::runtime_error("Failed to create OpenSSL context");
    }
    if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }

    std::vector<char> buffer(CHUNK_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0)
    {
        if (cancelled && cancelled())
        {
            throw CancelledError();
        }
        if (EVP_DigestUpdate(context.get(), buffer.data(), static_cast<std::size_t>(file.gcount())) != 1)
        {
            throw std::runtime_error("Failed to update SHA-256 digest");
        }
    }
    if (file.bad())
    {
        throw FileReadError("Hasher", fmt::format("Read error while hashing {}", filePath.string()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;
    if (EVP_DigestFinal_ex(context.get(), hash, &hashLength) != 1)
    {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }

    std::string hex;
    hex.reserve(hashLength * 2);
    for (unsigned int i = 0; i < hashLength; ++i)
    {
        hex += fmt::format("{:02x}", hash[i]);
    }
    return hex;
}

bool ChecksumVerifier::verify(const std::filesystem::path &filePath,
                              const std::string &expectedChecksum)
{
    std::string expected = parseChecksum(expectedChecksum);
    return computeSHA256(filePath) == expected;
}

std::string ChecksumVerifier::parseChecksum(const std::string &checksumStr)
{
    // Expected format: "sha256:abc123..."
    size_t colonPos = checksumStr.find(':');
    if (colonPos == std::string::npos)
    {
        throw std::invalid_argument("Invalid checksum format. Expected 'sha256:hexhash'");
    }

    std::string algorithm = checksumStr.substr(0, colonPos);
    std::transform(algorithm.begin(), algorithm.end(), algorithm.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    if (algorithm != "sha256")
    {
        throw std::invalid_argument(fmt::format("Unsupported algorithm: '{}'", algorithm));
    }

    std::string hex = normalizeHex(checksumStr.substr(colonPos + 1));
    if (hex.length() != SHA256_HEX_LENGTH)
    {
        throw std::invalid_argument(
            fmt::format("Invalid sha256 hash length. Expected {} hex characters, got {}",
                        SHA256_HEX_LENGTH, hex.length()));
    }
    return hex;
}

std::string ChecksumVerifier::normalizeHex(const std::string &hex)
{
    std::string result;
    result.reserve(hex.length());

    for (char ch : hex)
    {
        auto uch = static_cast<unsigned char>(ch);

        // Skip whitespace and common separators
        if (std::isspace(uch) || ch == ':' || ch == '-')
        {
            continue;
        }
        if (!std::isxdigit(uch))
        {
            throw std::invalid_argument(fmt::format("Invalid character in checksum: '{}'", ch));
        }
        result += static_cast<char>(std::tolower(uch));
    }

    return result;
}
