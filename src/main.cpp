#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <unistd.h>

#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header

#include "checksum.hpp"
#include "config.hpp"
#include "download_coordinator.hpp"
#include "errors.hpp"
#include "format.hpp"

namespace
{
    constexpr const char *VERSION = "1.0";
    constexpr int EXIT_INTERRUPTED = 130;

    // Set from the signal handler; lock-free so the store is async-signal-safe
    std::atomic<bool> interrupted{false};

    void handleInterrupt(int)
    {
        interrupted.store(true, std::memory_order_relaxed);
    }

    /**
     * One-line status display. Redraws in place on a terminal, prints a line
     * at most once per second otherwise (e.g., piped to a file).
     */
    class ProgressPrinter
    {
    public:
        ProgressPrinter() : isTerminalOutput_(::isatty(fileno(stdout))) {}

        void operator()(const ProgressSnapshot &snapshot)
        {
            auto now = std::chrono::steady_clock::now();
            auto interval = isTerminalOutput_ ? std::chrono::milliseconds(200) : std::chrono::milliseconds(1000);
            if (printedOnce_ && now - lastPrinted_ < interval)
            {
                return;
            }
            lastPrinted_ = now;
            printedOnce_ = true;

            double seconds = std::chrono::duration<double>(snapshot.elapsed).count();
            double speed = seconds > 0 ? static_cast<double>(snapshot.bytesDone) / seconds : 0.0;

            std::string line;
            if (snapshot.totalBytes && *snapshot.totalBytes > 0)
            {
                double percentage = static_cast<double>(snapshot.bytesDone) * 100.0 / static_cast<double>(*snapshot.totalBytes);
                long eta = speed > 0 ? static_cast<long>(static_cast<double>(*snapshot.totalBytes - snapshot.bytesDone) / speed) : -1;
                line = fmt::format("{:.1f}% | {} / {} | {} | segments {}/{} | ETA: {}",
                                   percentage,
                                   formatBytes(snapshot.bytesDone),
                                   formatBytes(*snapshot.totalBytes),
                                   formatSpeed(speed),
                                   snapshot.segmentsDone, snapshot.segmentCount,
                                   formatDuration(eta));
            }
            else
            {
                line = fmt::format("Downloaded: {} | {}", formatBytes(snapshot.bytesDone), formatSpeed(speed));
            }

            if (isTerminalOutput_)
            {
                fmt::print("\r{}\033[K", line);
                std::fflush(stdout);
            }
            else
            {
                fmt::print("{}\n", line);
            }
        }

        void finish() const
        {
            if (isTerminalOutput_ && printedOnce_)
            {
                fmt::print("\n");
            }
        }

    private:
        bool isTerminalOutput_;
        bool printedOnce_ = false;
        std::chrono::steady_clock::time_point lastPrinted_;
    };

    // Keep a file whose digest does not match out of the user's way
    void quarantine(const std::filesystem::path &file)
    {
        std::filesystem::path quarantineDir = file.parent_path() / "quarantine";
        std::filesystem::create_directories(quarantineDir);
        std::filesystem::path target = quarantineDir / file.filename();
        std::filesystem::rename(file, target);
        fmt::print(stderr, "  File moved to: {}\n", target.string());
    }
} // namespace

int main(int argc, char *argv[])
{
    CLI::App app{fmt::format("swiftdl v{} - Segmented, resumable HTTP(S) downloader", VERSION)};

    DownloadConfig config;

    app.add_option("URL", config.url, "HTTP/HTTPS URL to download")
        ->required()
        ->check([](const std::string &url) -> std::string
                {
            if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0) {
                return "";
            }
            return "URL must start with http:// or https://"; });

    app.add_option("DIRECTORY", config.outputDirectory,
                   "Directory to save the file in (default: your Downloads folder)");

    app.add_option("-t,--threads", config.threads, "Number of concurrent segments")
        ->check(CLI::Range(1, 64))
        ->default_val(8);

    app.add_option("-r,--retry-count,--max-retries", config.maxAttempts,
                   "Attempts per segment before giving up")
        ->check(CLI::Range(1, 10))
        ->default_val(3);

    app.add_option("--timeout", config.readTimeoutSeconds,
                   "Seconds without data before an attempt is abandoned")
        ->check(CLI::PositiveNumber)
        ->default_val(60);

    app.add_option("--connect-timeout", config.connectTimeoutSeconds, "Seconds allowed to connect")
        ->check(CLI::PositiveNumber)
        ->default_val(30);

    app.add_option("-c,--checksum", config.expectedChecksum,
                   "Expected checksum 'sha256:hexhash', checked after download")
        ->check([](const std::string &cs) -> std::string
                {
            try {
                ChecksumVerifier::parseChecksum(cs);
                return "";
            } catch (const std::exception &e) {
                return e.what();
            } });

    app.add_flag("-f,-y,--force", config.overwrite,
                 "Overwrite an existing file that is not an unfinished swiftdl download");
    app.add_flag("-q,--quiet", config.quiet, "Only print errors and the final report");
    app.add_flag("-v,--version", config.showVersion, "Display version information");

    // --version must work without the required URL
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v")
        {
            fmt::print("swiftdl v{}\n", VERSION);
            fmt::print("Built with libcurl {}, OpenSSL, CLI11, fmt\n", LIBCURL_VERSION);
            return 0;
        }
    }

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);

    try
    {
        DownloadCoordinator coordinator(config);
        coordinator.setInterruptFlag(&interrupted);

        ProgressPrinter printer;
        if (!config.quiet)
        {
            coordinator.setProgressCallback([&printer](const ProgressSnapshot &snapshot)
                                            { printer(snapshot); });
        }

        if (!config.quiet)
        {
            fmt::print("Starting download of '{}'\n", config.url);
        }

        DownloadResult result;
        try
        {
            result = coordinator.run();
        }
        catch (...)
        {
            printer.finish();
            throw;
        }
        printer.finish();

        fmt::print("✓ Download completed successfully{}\n", result.resumed ? " (resumed)" : "");
        fmt::print("  File:     {}\n", result.path.string());
        fmt::print("  Size:     {} ({} bytes)\n", formatBytes(result.totalBytes), result.totalBytes);
        fmt::print("  Time:     {}\n", formatDuration(static_cast<long>(result.elapsed.count() / 1000)));
        fmt::print("  SHA-256:  {}\n", result.sha256);

        int totalRetries = 0;
        for (int retries : result.segmentRetries)
        {
            totalRetries += retries;
        }
        if (totalRetries > 0)
        {
            fmt::print("  Retries:  {} across {} segments\n", totalRetries, result.segmentRetries.size());
        }

        if (config.expectedChecksum)
        {
            if (result.sha256 == ChecksumVerifier::parseChecksum(*config.expectedChecksum))
            {
                fmt::print("✓ Checksum verification passed!\n");
            }
            else
            {
                fmt::print(stderr, "✗ Checksum verification FAILED!\n");
                fmt::print(stderr, "  Expected: {}\n", *config.expectedChecksum);
                quarantine(result.path);
                return 1;
            }
        }
        return 0;
    }
    catch (const CancelledError &e)
    {
        fmt::print(stderr, "✗ {}\n", e.what());
        return EXIT_INTERRUPTED;
    }
    catch (const DownloadError &e)
    {
        fmt::print(stderr, "✗ Error [{}]: {}\n", e.component(), e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
