// SPDX-License-Identifier: MIT
// Reader bridge: libheif pulls data from a byte source via callbacks.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "callbackerror.hpp"
#include "stream.hpp"

#include <libheif/heif.h>

#include <filesystem>
#include <memory>
#include <span>
#include <vector>

class HeifReader;
using HeifReaderPtr = std::shared_ptr<HeifReader>;

/**
 * Base class for data sources read by libheif.
 * The instance is bound to a single source and is not thread-safe.
 * libheif keeps the pointer to the registration block, so the reader must
 * outlive every native object created from it.
 */
class HeifReader {
public:
    virtual ~HeifReader() = default;

    HeifReader(const HeifReader&) = delete;
    HeifReader& operator=(const HeifReader&) = delete;

    /**
     * Create reader for the file.
     * @param path path to the file
     * @return reader instance
     */
    static HeifReaderPtr from_file(const std::filesystem::path& path);

    /**
     * Create reader for the memory buffer, the reader owns the data.
     * @param data buffer with HEIF data
     * @return reader instance
     */
    static HeifReaderPtr from_memory(std::vector<uint8_t> data);

    /**
     * Create reader for the memory buffer, the buffer must outlive the
     * reader.
     * @param data buffer with HEIF data
     * @return reader instance
     */
    static HeifReaderPtr from_memory(std::span<const uint8_t> data);

    /**
     * Create reader for the stream, the reader owns the stream.
     * @param stream readable and seekable stream
     * @return reader instance
     */
    static HeifReaderPtr from_stream(StreamPtr stream);

    /**
     * Get registration block for libheif, created on first call.
     * @return pointer to the callbacks table
     */
    const heif_reader* handle();

    /**
     * Get user data to pass to libheif together with the handle.
     * @return pointer to the user data
     */
    void* user_data() { return this; }

    /**
     * Get slot with exception captured inside callbacks.
     * @return callback error slot
     */
    CallbackError& callback_error() { return cb_error; }

protected:
    HeifReader() = default;

    /**
     * Get current position.
     * @return offset from the beginning of the source
     */
    virtual int64_t get_position_core() = 0;

    /**
     * Read exactly specified number of bytes.
     * @param data destination buffer
     * @param count number of bytes to read
     * @return false if source has less than count bytes
     */
    virtual bool read_core(void* data, size_t count) = 0;

    /**
     * Set current position.
     * @param position new offset from the beginning of the source
     * @return false if position is out of the source
     */
    virtual bool seek_core(int64_t position) = 0;

    /**
     * Check if source can be read up to the specified size.
     * @param target_size required size of the source
     * @return source state
     */
    virtual heif_reader_grow_status
    wait_for_file_size_core(int64_t target_size) = 0;

private:
    // libheif callbacks
    static int64_t get_position(void* user_data) noexcept;
    static int read(void* data, size_t size, void* user_data) noexcept;
    static int seek(int64_t position, void* user_data) noexcept;
    static heif_reader_grow_status wait_for_file_size(int64_t target_size,
                                                      void* user_data) noexcept;

private:
    std::unique_ptr<heif_reader> registration; ///< Callbacks table
    CallbackError cb_error;                    ///< Callback exception
};

/** Reader for data in memory. */
class MemoryReader : public HeifReader {
public:
    /**
     * Constructor: take ownership of the buffer.
     * @param buf buffer with HEIF data
     */
    explicit MemoryReader(std::vector<uint8_t> buf);

    /**
     * Constructor: use external buffer.
     * @param buf buffer with HEIF data, must outlive the reader
     */
    explicit MemoryReader(std::span<const uint8_t> buf);

protected:
    int64_t get_position_core() override;
    bool read_core(void* data, size_t count) override;
    bool seek_core(int64_t position) override;
    heif_reader_grow_status
    wait_for_file_size_core(int64_t target_size) override;

private:
    std::vector<uint8_t> owned;
    std::span<const uint8_t> data;
    uint64_t pos = 0;
};

/** Reader for abstract stream. */
class StreamReader : public HeifReader {
public:
    /**
     * Constructor: take ownership of the stream.
     * @param source readable and seekable stream
     */
    explicit StreamReader(StreamPtr source);

    /**
     * Constructor: use external stream.
     * @param source readable and seekable stream, must outlive the reader
     */
    explicit StreamReader(Stream& source);

protected:
    int64_t get_position_core() override;
    bool read_core(void* data, size_t count) override;
    bool seek_core(int64_t position) override;
    heif_reader_grow_status
    wait_for_file_size_core(int64_t target_size) override;

private:
    StreamPtr owned;
    Stream& stream;
    std::vector<uint8_t> chunk; ///< Intermediate buffer
};
