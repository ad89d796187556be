// SPDX-License-Identifier: MIT
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "callbackerror.hpp"
#include "heiferror.hpp"

#include <gtest/gtest.h>

#include <system_error>

static constexpr heif_error OK = { heif_error_Ok, heif_suberror_Unspecified,
                                   "Success" };
static constexpr heif_error INVALID = { heif_error_Invalid_input,
                                        heif_suberror_No_ftyp_box,
                                        "No ftyp box" };

TEST(HeifErrorTest, FromNative)
{
    const HeifError err(INVALID);
    EXPECT_EQ(err.code(), heif_error_Invalid_input);
    EXPECT_EQ(err.subcode(), heif_suberror_No_ftyp_box);
    EXPECT_STREQ(err.what(), "No ftyp box");
}

TEST(HeifErrorTest, EmptyMessage)
{
    const heif_error null_msg = { heif_error_Decoder_plugin_error,
                                  heif_suberror_Unspecified, nullptr };
    EXPECT_STREQ(HeifError(null_msg).what(), "Unspecified error");

    const heif_error empty_msg = { heif_error_Decoder_plugin_error,
                                   heif_suberror_Unspecified, "" };
    EXPECT_STREQ(HeifError(empty_msg).what(), "Unspecified error");
}

TEST(HeifErrorTest, Custom)
{
    const HeifError err("custom");
    EXPECT_EQ(err.code(), heif_error_Usage_error);
    EXPECT_EQ(err.subcode(), heif_suberror_Unspecified);
    EXPECT_STREQ(err.what(), "custom");
}

TEST(HeifErrorTest, Check)
{
    EXPECT_NO_THROW(HeifError::check(OK));
    EXPECT_THROW(HeifError::check(INVALID), HeifError);
}

TEST(HeifErrorTest, CallbackErrorFirst)
{
    CallbackError cb;
    cb.capture(std::make_exception_ptr(
        std::system_error(EIO, std::generic_category(), "io")));

    // exception from the callback has priority over native error
    EXPECT_THROW(HeifError::check(INVALID, &cb), std::system_error);
    EXPECT_FALSE(cb.has_error());

    // the slot is empty, so native error is reported
    EXPECT_THROW(HeifError::check(INVALID, &cb), HeifError);
}

TEST(HeifErrorTest, CallbackErrorWithSuccess)
{
    CallbackError cb;
    cb.capture(std::make_exception_ptr(std::runtime_error("lost")));
    EXPECT_THROW(HeifError::check(OK, &cb), std::runtime_error);
    EXPECT_FALSE(cb.has_error());
}

TEST(HeifErrorTest, NoCallbackSlot)
{
    EXPECT_NO_THROW(HeifError::check(OK, nullptr));
    EXPECT_THROW(HeifError::check(INVALID, nullptr), HeifError);
}
