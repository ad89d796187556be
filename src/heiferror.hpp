// SPDX-License-Identifier: MIT
// libheif error reporting.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include <libheif/heif.h>

#include <stdexcept>
#include <string>

class CallbackError;

/** Error reported by libheif or by the bindings on top of it. */
class HeifError : public std::runtime_error {
public:
    /**
     * Constructor: create exception from libheif error description.
     * @param err libheif error structure
     */
    explicit HeifError(const heif_error& err);

    /**
     * Constructor: create exception with custom message.
     * @param msg error message
     * @param code libheif error code
     * @param subcode libheif error subcode
     */
    HeifError(const std::string& msg,
              heif_error_code code = heif_error_Usage_error,
              heif_suberror_code subcode = heif_suberror_Unspecified);

    /**
     * Get libheif error code.
     * @return error code
     */
    heif_error_code code() const noexcept { return err_code; }

    /**
     * Get libheif error subcode.
     * @return error subcode
     */
    heif_suberror_code subcode() const noexcept { return err_subcode; }

    /**
     * Throw exception if libheif reported an error.
     * @param err libheif error structure
     */
    static void check(const heif_error& err);

    /**
     * Handle result of a native call that could run I/O callbacks.
     * Exception captured inside a callback takes precedence over the
     * error reported by libheif.
     * @param err libheif error structure
     * @param cb_error callback error slot, may be nullptr
     */
    static void check(const heif_error& err, CallbackError* cb_error);

private:
    heif_error_code err_code;
    heif_suberror_code err_subcode;
};
