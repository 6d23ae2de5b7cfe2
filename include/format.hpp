#pragma once

#include <cstdint>
#include <string>

/**
 * Format bytes into human-readable string (e.g., "52.30 MB")
 */
std::string formatBytes(std::uint64_t bytes);

/**
 * Format duration into human-readable string (e.g., "2m 30s")
 * Negative durations are reported as "unknown".
 */
std::string formatDuration(long seconds);

// Transfer rate (e.g., "1.50 MB/s")
std::string formatSpeed(double bytesPerSecond);
