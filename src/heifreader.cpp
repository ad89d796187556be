// SPDX-License-Identifier: MIT
// Reader bridge: libheif pulls data from a byte source via callbacks.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "heifreader.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

// Return codes of read/seek callbacks
static constexpr int CB_SUCCESS = 0;
static constexpr int CB_FAILURE = 1;

// Version of the reader callbacks table
static constexpr int READER_API_VERSION = 1;

HeifReaderPtr HeifReader::from_file(const std::filesystem::path& path)
{
    return std::make_shared<StreamReader>(
        std::make_unique<FileStream>(path, FileStream::Mode::Read));
}

HeifReaderPtr HeifReader::from_memory(std::vector<uint8_t> data)
{
    return std::make_shared<MemoryReader>(std::move(data));
}

HeifReaderPtr HeifReader::from_memory(std::span<const uint8_t> data)
{
    return std::make_shared<MemoryReader>(data);
}

HeifReaderPtr HeifReader::from_stream(StreamPtr stream)
{
    return std::make_shared<StreamReader>(std::move(stream));
}

const heif_reader* HeifReader::handle()
{
    if (!registration) {
        // value-initialized: slots of newer API versions stay null
        registration = std::make_unique<heif_reader>();
        registration->reader_api_version = READER_API_VERSION;
        registration->get_position = &HeifReader::get_position;
        registration->read = &HeifReader::read;
        registration->seek = &HeifReader::seek;
        registration->wait_for_file_size = &HeifReader::wait_for_file_size;
    }
    return registration.get();
}

int64_t HeifReader::get_position(void* user_data) noexcept
{
    HeifReader* self = static_cast<HeifReader*>(user_data);
    try {
        return self->get_position_core();
    } catch (...) {
        self->cb_error.capture();
        return -1;
    }
}

int HeifReader::read(void* data, size_t size, void* user_data) noexcept
{
    if (size == 0) {
        return CB_SUCCESS;
    }
    if (!data) {
        return CB_FAILURE;
    }

    HeifReader* self = static_cast<HeifReader*>(user_data);
    try {
        return self->read_core(data, size) ? CB_SUCCESS : CB_FAILURE;
    } catch (...) {
        self->cb_error.capture();
        return CB_FAILURE;
    }
}

int HeifReader::seek(int64_t position, void* user_data) noexcept
{
    HeifReader* self = static_cast<HeifReader*>(user_data);
    try {
        return self->seek_core(position) ? CB_SUCCESS : CB_FAILURE;
    } catch (...) {
        self->cb_error.capture();
        return CB_FAILURE;
    }
}

heif_reader_grow_status HeifReader::wait_for_file_size(int64_t target_size,
                                                       void* user_data) noexcept
{
    HeifReader* self = static_cast<HeifReader*>(user_data);
    try {
        return self->wait_for_file_size_core(target_size);
    } catch (...) {
        self->cb_error.capture();
        return heif_reader_grow_status_size_beyond_eof;
    }
}

MemoryReader::MemoryReader(std::vector<uint8_t> buf)
    : owned(std::move(buf))
    , data(owned)
{
}

MemoryReader::MemoryReader(std::span<const uint8_t> buf)
    : data(buf)
{
}

int64_t MemoryReader::get_position_core()
{
    return static_cast<int64_t>(pos);
}

bool MemoryReader::read_core(void* dst, size_t count)
{
    if (pos > data.size() || count > data.size() - pos) {
        return false;
    }
    std::memcpy(dst, data.data() + pos, count);
    pos += count;
    return true;
}

bool MemoryReader::seek_core(int64_t position)
{
    if (position < 0 || static_cast<uint64_t>(position) > data.size()) {
        return false;
    }
    pos = position;
    return true;
}

heif_reader_grow_status MemoryReader::wait_for_file_size_core(int64_t target)
{
    return target > static_cast<int64_t>(data.size())
        ? heif_reader_grow_status_size_beyond_eof
        : heif_reader_grow_status_size_reached;
}

/**
 * Check stream capabilities required by the reader.
 * @param stream stream to check
 * @return reference to the stream
 */
static Stream& readable_stream(Stream* stream)
{
    if (!stream) {
        throw std::invalid_argument("Stream is not specified");
    }
    if (!stream->readable() || !stream->seekable()) {
        throw std::invalid_argument(
            "The stream must support reading and seeking");
    }
    return *stream;
}

StreamReader::StreamReader(StreamPtr source)
    : owned(std::move(source))
    , stream(readable_stream(owned.get()))
    , chunk(STREAM_CHUNK_SIZE)
{
}

StreamReader::StreamReader(Stream& source)
    : stream(readable_stream(&source))
    , chunk(STREAM_CHUNK_SIZE)
{
}

int64_t StreamReader::get_position_core()
{
    return static_cast<int64_t>(stream.position());
}

bool StreamReader::read_core(void* data, size_t count)
{
    uint8_t* dst = static_cast<uint8_t*>(data);

    while (count) {
        const size_t len =
            stream.read(chunk.data(), std::min(count, chunk.size()));
        if (len == 0) {
            return false; // short read
        }
        std::memcpy(dst, chunk.data(), len);
        dst += len;
        count -= len;
    }

    return true;
}

bool StreamReader::seek_core(int64_t position)
{
    if (position < 0 || static_cast<uint64_t>(position) > stream.length()) {
        return false;
    }
    stream.seek(position);
    return true;
}

heif_reader_grow_status StreamReader::wait_for_file_size_core(int64_t target)
{
    return target > static_cast<int64_t>(stream.length())
        ? heif_reader_grow_status_size_beyond_eof
        : heif_reader_grow_status_size_reached;
}
