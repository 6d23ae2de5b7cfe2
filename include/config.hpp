#pragma once

#include <cstdint>
#include <string>
#include <optional> // C++17 feature for optional values

/**
 * Configuration for a segmented download.
 * Populated by the CLI11 parser in main.cpp, or by runDownload() with defaults.
 */
struct DownloadConfig
{
    // Required parameters
    std::string url;
    std::string outputDirectory; // Empty = platform Downloads folder

    // Optional parameters with sensible defaults
    int threads = 8;              // Upper bound on concurrent segments
    int maxAttempts = 3;          // Attempts per segment before it is marked Failed
    int retryDelayMs = 1000;      // First backoff delay, doubled per attempt
    int connectTimeoutSeconds = 30;
    int readTimeoutSeconds = 60;  // Stall timeout: no data for this long aborts the attempt
    long maxRedirects = 5;

    // Segments are never planned smaller than this (except the last one)
    std::uint64_t minSegmentSize = 64 * 1024;

    // Checksum verification (optional)
    std::optional<std::string> expectedChecksum; // Format: "sha256:abc123..."

    // Flags
    bool overwrite = false;   // Replace an existing output file that has no resume sidecar
    bool quiet = false;       // Suppress informational output from the engine
    bool showVersion = false; // Display version and exit
};
