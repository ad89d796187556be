// SPDX-License-Identifier: MIT
// Writer bridge: libheif pushes encoded data to a destination via callback.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "callbackerror.hpp"
#include "stream.hpp"

#include <libheif/heif.h>

#include <memory>
#include <vector>

/**
 * Base class for destinations written by libheif.
 * The registration block must stay alive until heif_context_write returns.
 */
class HeifWriter {
public:
    virtual ~HeifWriter() = default;

    HeifWriter(const HeifWriter&) = delete;
    HeifWriter& operator=(const HeifWriter&) = delete;

    /**
     * Get registration block for libheif, created on first call.
     * @return pointer to the callbacks table
     */
    heif_writer* handle();

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
    HeifWriter() = default;

    /**
     * Write all data to the destination.
     * @param data source buffer
     * @param size number of bytes to write
     */
    virtual void write_core(const void* data, size_t size) = 0;

private:
    // libheif callback
    static heif_error write(heif_context* ctx, const void* data, size_t size,
                            void* user_data) noexcept;

private:
    std::unique_ptr<heif_writer> registration; ///< Callbacks table
    CallbackError cb_error;                    ///< Callback exception
};

/** Writer to abstract stream. */
class StreamWriter : public HeifWriter {
public:
    /**
     * Constructor: take ownership of the stream.
     * @param target writable stream
     */
    explicit StreamWriter(StreamPtr target);

    /**
     * Constructor: use external stream.
     * @param target writable stream, must outlive the writer
     */
    explicit StreamWriter(Stream& target);

protected:
    void write_core(const void* data, size_t size) override;

private:
    StreamPtr owned;
    Stream& stream;
    std::vector<uint8_t> chunk; ///< Intermediate buffer
};
