// SPDX-License-Identifier: MIT
// Exceptions captured inside native callbacks.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include <cstddef>
#include <exception>

/**
 * Slot for exception raised inside a callback invoked by libheif.
 * Exceptions must not unwind through C frames, so callbacks store the
 * exception here and report failure through the native return value.
 * The first captured exception wins until the slot is rethrown or reset.
 */
class CallbackError {
public:
    /**
     * Capture currently handled exception (call from catch block only).
     * Does nothing if another exception is already stored.
     */
    void capture() noexcept;

    /**
     * Store exception if the slot is empty.
     * Nothing is logged here: capture runs inside native callbacks.
     * @param ex exception to store
     */
    void capture(std::exception_ptr ex) noexcept;

    /**
     * Check if the slot contains an exception.
     * @return true if exception was captured
     */
    bool has_error() const noexcept { return static_cast<bool>(error); }

    /**
     * Get captured exception.
     * @return pointer to exception, null if slot is empty
     */
    const std::exception_ptr& exception() const noexcept { return error; }

    /**
     * Get number of exceptions dropped because the slot was occupied.
     * @return number of dropped exceptions since last rethrow/reset
     */
    size_t dropped_count() const noexcept { return dropped; }

    /**
     * Rethrow captured exception and clear the slot.
     * Does nothing if the slot is empty.
     */
    void rethrow();

    /**
     * Drop captured exception.
     */
    void reset() noexcept
    {
        error = nullptr;
        dropped = 0;
    }

private:
    std::exception_ptr error;
    size_t dropped = 0; ///< Number of exceptions lost after the first one
};
