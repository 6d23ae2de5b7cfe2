#pragma once

#include <filesystem>
#include <optional>
#include <string>

/**
 * Last path segment of a URL, without query or fragment, percent-decoded.
 * Returns "downloaded_file" when the URL has no usable file name.
 */
std::string fileNameFromUrl(const std::string &url);

/**
 * File name from a Content-Disposition header value.
 * RFC 5987 "filename*=UTF-8''..." wins over a plain "filename=".
 * Directory components are stripped so the name cannot escape the output directory.
 */
std::optional<std::string> fileNameFromContentDisposition(const std::string &headerValue);

/**
 * The user's Downloads folder: $XDG_DOWNLOAD_DIR, then XDG_DOWNLOAD_DIR from
 * $XDG_CONFIG_HOME/user-dirs.dirs (default ~/.config), then $HOME/Downloads,
 * then the current directory.
 */
std::filesystem::path defaultDownloadDirectory();

/**
 * Ensure a directory exists, creating it (and parents) if needed.
 * @throws FileWriteError if the directory cannot be created
 */
void ensureDirectoryExists(const std::filesystem::path &directory);
