// SPDX-License-Identifier: MIT
// Byte streams: abstract source/destination for HEIF data.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

// Size of the buffer used to move data between a stream and native memory:
// the largest multiple of 4096 below 80 KiB
constexpr size_t STREAM_CHUNK_SIZE = 81920;

/**
 * Abstract byte stream.
 * Errors are reported with exceptions (std::system_error for OS errors).
 */
class Stream {
public:
    virtual ~Stream() = default;

    /**
     * Check if the stream supports reading.
     * @return true if read() is available
     */
    virtual bool readable() const = 0;

    /**
     * Check if the stream supports random access.
     * @return true if seek() and length() are available
     */
    virtual bool seekable() const = 0;

    /**
     * Check if the stream supports writing.
     * @return true if write() is available
     */
    virtual bool writable() const = 0;

    /**
     * Read data from the current position.
     * @param buffer destination buffer
     * @param size max number of bytes to read
     * @return number of bytes read, 0 at the end of stream
     */
    virtual size_t read(void* buffer, size_t size) = 0;

    /**
     * Write data to the current position.
     * @param buffer source buffer
     * @param size number of bytes to write
     */
    virtual void write(const void* buffer, size_t size) = 0;

    /**
     * Get current position.
     * @return offset from the beginning of the stream
     */
    virtual uint64_t position() const = 0;

    /**
     * Set current position.
     * @param pos offset from the beginning of the stream
     */
    virtual void seek(uint64_t pos) = 0;

    /**
     * Get stream size.
     * @return total size of the stream in bytes
     */
    virtual uint64_t length() const = 0;
};

using StreamPtr = std::unique_ptr<Stream>;

/** File stream. */
class FileStream : public Stream {
public:
    /** Open mode. */
    enum class Mode : uint8_t {
        Read,  ///< Open existing file for reading
        Write, ///< Create or truncate file for writing
    };

    /**
     * Constructor: open file.
     * @param path path to the file
     * @param mode open mode
     */
    FileStream(const std::filesystem::path& path, Mode mode);

    ~FileStream() override;

    FileStream(const FileStream&) = delete;
    FileStream& operator=(const FileStream&) = delete;

    bool readable() const override { return mode == Mode::Read; }
    bool seekable() const override { return true; }
    bool writable() const override { return mode == Mode::Write; }
    size_t read(void* buffer, size_t size) override;
    void write(const void* buffer, size_t size) override;
    uint64_t position() const override;
    void seek(uint64_t pos) override;
    uint64_t length() const override;

private:
    int fd = -1;
    Mode mode;
};

/** Memory stream backed by a growable buffer. */
class MemoryStream : public Stream {
public:
    /**
     * Constructor: create empty writable stream.
     */
    MemoryStream() = default;

    /**
     * Constructor: create stream over existing data.
     * @param buf initial stream content
     * @param rw true to allow writing
     */
    explicit MemoryStream(std::vector<uint8_t> buf, bool rw = false);

    bool readable() const override { return true; }
    bool seekable() const override { return true; }
    bool writable() const override { return rw_flag; }
    size_t read(void* buffer, size_t size) override;
    void write(const void* buffer, size_t size) override;
    uint64_t position() const override { return pos; }
    void seek(uint64_t offset) override { pos = offset; }
    uint64_t length() const override { return data.size(); }

    /**
     * Get stream content.
     * @return buffer with stream data
     */
    const std::vector<uint8_t>& buffer() const { return data; }

private:
    std::vector<uint8_t> data;
    uint64_t pos = 0;
    bool rw_flag = true;
};
