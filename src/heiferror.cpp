// SPDX-License-Identifier: MIT
// libheif error reporting.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "heiferror.hpp"

#include "callbackerror.hpp"

// Message used when libheif doesn't provide any description
static constexpr const char* UNSPECIFIED_ERROR = "Unspecified error";

HeifError::HeifError(const heif_error& err)
    : std::runtime_error(err.message && *err.message ? err.message
                                                     : UNSPECIFIED_ERROR)
    , err_code(err.code)
    , err_subcode(err.subcode)
{
}

HeifError::HeifError(const std::string& msg, heif_error_code code,
                     heif_suberror_code subcode)
    : std::runtime_error(msg)
    , err_code(code)
    , err_subcode(subcode)
{
}

void HeifError::check(const heif_error& err)
{
    if (err.code != heif_error_Ok) {
        throw HeifError(err);
    }
}

void HeifError::check(const heif_error& err, CallbackError* cb_error)
{
    if (cb_error) {
        cb_error->rethrow();
    }
    check(err);
}
