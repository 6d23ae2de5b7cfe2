#include "output_file.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

#include "errors.hpp"

namespace
{
    std::string lastErrno()
    {
        return std::strerror(errno);
    }
} // namespace

OutputFile::OutputFile(const std::filesystem::path &path) : path_(path)
{
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0)
    {
        throw FileWriteError("OutputFile", fmt::format("Cannot open file for writing: {} ({})",
                                                       path.string(), lastErrno()));
    }
}

OutputFile::~OutputFile()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
    }
}

void OutputFile::resize(std::uint64_t size)
{
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0)
    {
        throw FileWriteError("OutputFile", fmt::format("Cannot resize {} to {} bytes: {}",
                                                       path_.string(), size, lastErrno()));
    }
}

void OutputFile::writeAt(std::uint64_t offset, const char *data, std::size_t size)
{
    while (size > 0)
    {
        ssize_t written = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw FileWriteError("OutputFile", fmt::format("Write failed at offset {} in {}: {}",
                                                           offset, path_.string(), lastErrno()));
        }
        data += written;
        size -= static_cast<std::size_t>(written);
        offset += static_cast<std::uint64_t>(written);
    }
}

void OutputFile::sync()
{
    if (::fdatasync(fd_) != 0)
    {
        throw FileWriteError("OutputFile", fmt::format("Cannot flush {}: {}", path_.string(), lastErrno()));
    }
}

std::uint64_t OutputFile::size() const
{
    struct stat info
    {
    };
    if (::fstat(fd_, &info) != 0)
    {
        throw FileReadError("OutputFile", fmt::format("Cannot stat {}: {}", path_.string(), lastErrno()));
    }
    return static_cast<std::uint64_t>(info.st_size);
}
