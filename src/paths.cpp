#include "paths.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>

#include <fmt/core.h>

#include "errors.hpp"

namespace
{
    constexpr const char *FALLBACK_FILE_NAME = "downloaded_file";

    int hexValue(char ch)
    {
        if (ch >= '0' && ch <= '9')
            return ch - '0';
        if (ch >= 'a' && ch <= 'f')
            return ch - 'a' + 10;
        if (ch >= 'A' && ch <= 'F')
            return ch - 'A' + 10;
        return -1;
    }

    // Malformed escapes are kept literally
    std::string percentDecode(const std::string &value)
    {
        std::string result;
        result.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i)
        {
            if (value[i] == '%' && i + 2 < value.size())
            {
                int high = hexValue(value[i + 1]);
                int low = hexValue(value[i + 2]);
                if (high >= 0 && low >= 0)
                {
                    result += static_cast<char>(high * 16 + low);
                    i += 2;
                    continue;
                }
            }
            result += value[i];
        }
        return result;
    }

    // Keep only the last component and reject names that mean "this dir" / "parent dir"
    std::optional<std::string> sanitizeFileName(std::string name)
    {
        size_t slash = name.find_last_of("/\\");
        if (slash != std::string::npos)
        {
            name = name.substr(slash + 1);
        }
        if (name.empty() || name == "." || name == "..")
        {
            return std::nullopt;
        }
        return name;
    }

    std::string trimQuotesAndSpace(std::string value)
    {
        const char *junk = " \t\"";
        size_t first = value.find_first_not_of(junk);
        if (first == std::string::npos)
        {
            return "";
        }
        size_t last = value.find_last_not_of(junk);
        return value.substr(first, last - first + 1);
    }

    /**
     * XDG_DOWNLOAD_DIR from a user-dirs.dirs file, with "$HOME" expanded.
     * Lines look like: XDG_DOWNLOAD_DIR="$HOME/Downloads"
     */
    std::optional<std::filesystem::path> downloadDirFromUserDirs(const std::filesystem::path &file,
                                                                 const std::string &home)
    {
        std::ifstream in(file);
        std::string line;
        while (std::getline(in, line))
        {
            const std::string key = "XDG_DOWNLOAD_DIR=";
            if (line.rfind(key, 0) != 0)
            {
                continue;
            }
            std::string value = trimQuotesAndSpace(line.substr(key.size()));
            if (value.rfind("$HOME", 0) == 0)
            {
                if (home.empty())
                {
                    return std::nullopt;
                }
                value = home + value.substr(5);
            }
            // Only absolute paths are valid in this file
            if (value.empty() || value.front() != '/')
            {
                return std::nullopt;
            }
            return std::filesystem::path(value);
        }
        return std::nullopt;
    }
} // namespace

std::string fileNameFromUrl(const std::string &url)
{
    std::string path = url;

    size_t cut = path.find_first_of("?#");
    if (cut != std::string::npos)
    {
        path = path.substr(0, cut);
    }

    // Skip "scheme://host" so a bare host is not mistaken for a file name
    size_t scheme = path.find("://");
    if (scheme != std::string::npos)
    {
        size_t pathStart = path.find('/', scheme + 3);
        path = pathStart == std::string::npos ? "" : path.substr(pathStart);
    }

    auto name = sanitizeFileName(percentDecode(path));
    return name ? *name : FALLBACK_FILE_NAME;
}

std::optional<std::string> fileNameFromContentDisposition(const std::string &headerValue)
{
    std::optional<std::string> plain;
    std::optional<std::string> extended;

    size_t pos = 0;
    while (pos < headerValue.size())
    {
        size_t end = headerValue.find(';', pos);
        if (end == std::string::npos)
        {
            end = headerValue.size();
        }
        std::string part = headerValue.substr(pos, end - pos);
        pos = end + 1;

        size_t equals = part.find('=');
        if (equals == std::string::npos)
        {
            continue;
        }

        std::string key = trimQuotesAndSpace(part.substr(0, equals));
        for (auto &ch : key)
        {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        std::string value = trimQuotesAndSpace(part.substr(equals + 1));

        if (key == "filename*")
        {
            // charset'language'percent-encoded-value
            size_t quote = value.find('\'');
            size_t secondQuote = quote == std::string::npos ? std::string::npos : value.find('\'', quote + 1);
            if (secondQuote != std::string::npos)
            {
                extended = sanitizeFileName(percentDecode(value.substr(secondQuote + 1)));
            }
        }
        else if (key == "filename")
        {
            plain = sanitizeFileName(value);
        }
    }

    return extended ? extended : plain;
}

std::filesystem::path defaultDownloadDirectory()
{
    if (const char *xdg = std::getenv("XDG_DOWNLOAD_DIR"); xdg && *xdg)
    {
        return std::filesystem::path(xdg);
    }

    const char *home = std::getenv("HOME");
    std::string homeDir = home ? home : "";

    // xdg-user-dirs keeps the setting in $XDG_CONFIG_HOME/user-dirs.dirs, not in the environment
    std::filesystem::path configHome;
    if (const char *config = std::getenv("XDG_CONFIG_HOME"); config && *config)
    {
        configHome = config;
    }
    else if (!homeDir.empty())
    {
        configHome = std::filesystem::path(homeDir) / ".config";
    }
    if (!configHome.empty())
    {
        if (auto configured = downloadDirFromUserDirs(configHome / "user-dirs.dirs", homeDir))
        {
            return *configured;
        }
    }

    if (!homeDir.empty())
    {
        return std::filesystem::path(homeDir) / "Downloads";
    }
    return std::filesystem::current_path();
}

void ensureDirectoryExists(const std::filesystem::path &directory)
{
    // If directory is empty (file in current dir), nothing to create
    if (directory.empty())
    {
        return;
    }

    try
    {
        std::filesystem::create_directories(directory);
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        throw FileWriteError("Paths", fmt::format("Failed to create directory {}: {}",
                                                  directory.string(), e.what()));
    }
}
