// SPDX-License-Identifier: MIT
// Exceptions captured inside native callbacks.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "callbackerror.hpp"

#include "log.hpp"

/**
 * Get description of the exception.
 * @param ex exception to describe
 * @return exception message
 */
static std::string describe(const std::exception_ptr& ex)
{
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

void CallbackError::capture() noexcept
{
    capture(std::current_exception());
}

void CallbackError::capture(std::exception_ptr ex) noexcept
{
    if (!ex) {
        return;
    }
    if (error) {
        ++dropped;
    } else {
        error = std::move(ex);
    }
}

void CallbackError::rethrow()
{
    if (error) {
        std::exception_ptr ex = std::move(error);
        const size_t lost = dropped;
        error = nullptr;
        dropped = 0;
        if (Log::verbose_flag()) {
            Log::debug("Callback error: {}", describe(ex));
            if (lost) {
                Log::debug("Callback errors dropped: {}", lost);
            }
        }
        std::rethrow_exception(ex);
    }
}
