// SPDX-License-Identifier: MIT
// Writer bridge: libheif pushes encoded data to a destination via callback.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "heifwriter.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

// Version of the writer callbacks table
static constexpr int WRITER_API_VERSION = 1;

// Results of write callback, messages are static: libheif doesn't copy them
static constexpr heif_error WRITE_SUCCESS = { heif_error_Ok,
                                              heif_suberror_Unspecified,
                                              "Success" };
static constexpr heif_error WRITE_ERROR = {
    heif_error_Encoding_error, heif_suberror_Cannot_write_output_data,
    "Write error"
};

heif_writer* HeifWriter::handle()
{
    if (!registration) {
        registration = std::make_unique<heif_writer>();
        registration->writer_api_version = WRITER_API_VERSION;
        registration->write = &HeifWriter::write;
    }
    return registration.get();
}

heif_error HeifWriter::write(heif_context*, const void* data, size_t size,
                             void* user_data) noexcept
{
    if (size == 0) {
        return WRITE_SUCCESS;
    }
    if (!data) {
        return WRITE_ERROR;
    }

    HeifWriter* self = static_cast<HeifWriter*>(user_data);
    try {
        self->write_core(data, size);
    } catch (...) {
        self->cb_error.capture();
        return WRITE_ERROR;
    }

    return WRITE_SUCCESS;
}

/**
 * Check stream capabilities required by the writer.
 * @param stream stream to check
 * @return reference to the stream
 */
static Stream& writable_stream(Stream* stream)
{
    if (!stream) {
        throw std::invalid_argument("Stream is not specified");
    }
    if (!stream->writable()) {
        throw std::invalid_argument("The stream must support writing");
    }
    return *stream;
}

StreamWriter::StreamWriter(StreamPtr target)
    : owned(std::move(target))
    , stream(writable_stream(owned.get()))
    , chunk(STREAM_CHUNK_SIZE)
{
}

StreamWriter::StreamWriter(Stream& target)
    : stream(writable_stream(&target))
    , chunk(STREAM_CHUNK_SIZE)
{
}

void StreamWriter::write_core(const void* data, size_t size)
{
    const uint8_t* src = static_cast<const uint8_t*>(data);

    while (size) {
        const size_t len = std::min(size, chunk.size());
        std::memcpy(chunk.data(), src, len);
        stream.write(chunk.data(), len);
        src += len;
        size -= len;
    }
}
