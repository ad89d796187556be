// SPDX-License-Identifier: MIT
// Byte streams: abstract source/destination for HEIF data.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "stream.hpp"

#include "log.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

/**
 * Throw exception for the last system error.
 * @param what error description
 */
[[noreturn]] static void throw_errno(const std::string& what)
{
    throw std::system_error(errno, std::generic_category(), what);
}

FileStream::FileStream(const std::filesystem::path& path, Mode mode)
    : mode(mode)
{
    if (mode == Mode::Read) {
        fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } else {
        fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                  0644);
    }
    if (fd == -1) {
        const int code = errno;
        Log::debug("Unable to open {}: {}", path.string(),
                   std::strerror(code));
        throw std::system_error(code, std::generic_category(),
                                path.string());
    }
}

FileStream::~FileStream()
{
    if (fd != -1) {
        close(fd);
    }
}

size_t FileStream::read(void* buffer, size_t size)
{
    uint8_t* dst = static_cast<uint8_t*>(buffer);
    size_t total = 0;

    while (total < size) {
        const ssize_t rc = ::read(fd, dst + total, size - total);
        if (rc == 0) {
            break; // end of file
        }
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno("Unable to read file");
        }
        total += rc;
    }

    return total;
}

void FileStream::write(const void* buffer, size_t size)
{
    const uint8_t* src = static_cast<const uint8_t*>(buffer);

    while (size) {
        const ssize_t rc = ::write(fd, src, size);
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno("Unable to write file");
        }
        src += rc;
        size -= rc;
    }
}

uint64_t FileStream::position() const
{
    const off_t pos = lseek(fd, 0, SEEK_CUR);
    if (pos == -1) {
        throw_errno("Unable to get file position");
    }
    return pos;
}

void FileStream::seek(uint64_t pos)
{
    if (lseek(fd, static_cast<off_t>(pos), SEEK_SET) == -1) {
        throw_errno("Unable to set file position");
    }
}

uint64_t FileStream::length() const
{
    struct stat st;
    if (fstat(fd, &st) == -1) {
        throw_errno("Unable to get file size");
    }
    return st.st_size;
}

MemoryStream::MemoryStream(std::vector<uint8_t> buf, bool rw)
    : data(std::move(buf))
    , rw_flag(rw)
{
}

size_t MemoryStream::read(void* buffer, size_t size)
{
    if (pos >= data.size()) {
        return 0;
    }
    const size_t len = std::min<uint64_t>(size, data.size() - pos);
    std::memcpy(buffer, data.data() + pos, len);
    pos += len;
    return len;
}

void MemoryStream::write(const void* buffer, size_t size)
{
    if (!rw_flag) {
        throw std::system_error(EBADF, std::generic_category(),
                                "Memory stream is read only");
    }
    if (size == 0) {
        return;
    }
    const uint64_t end = pos + size;
    if (end > data.size()) {
        data.resize(end);
    }
    std::memcpy(data.data() + pos, buffer, size);
    pos = end;
}
