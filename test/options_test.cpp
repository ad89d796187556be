// SPDX-License-Identifier: MIT
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "heifoptions.hpp"
#include "log.hpp"
#include "nativelayout.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using namespace NativeLayout;

class DecodingOptionsTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        Log::verbose_flag() = true;
        Log::sink() = [this](Log::Level level, const std::string& msg) {
            if (level == Log::Level::Debug) {
                logged.push_back(msg);
            }
        };

        options.ignore_transformations = true;
        options.convert_hdr_to_8bit = true;
        options.strict = true;
        options.decoder_id = "libde265";
        options.color_conversion.downsampling =
            heif_chroma_downsampling_sharp_yuv;
        options.color_conversion.upsampling =
            heif_chroma_upsampling_nearest_neighbor;
        options.color_conversion.only_use_preferred = true;
    }

    void TearDown() override
    {
        Log::sink() = nullptr;
        Log::verbose_flag() = false;
    }

    HeifDecodingOptions options;
    NativeArena arena;
    std::vector<std::string> logged;
};

TEST_F(DecodingOptionsTest, Version5)
{
    DecodingV5 block {};
    block.version = 5;
    options.write(&block, arena);

    EXPECT_EQ(block.version, 5);
    EXPECT_EQ(block.ignore_transformations, 1);
    EXPECT_EQ(block.convert_hdr_to_8bit, 1);
    EXPECT_EQ(block.strict_decoding, 1);
    ASSERT_NE(block.decoder_id, nullptr);
    EXPECT_STREQ(block.decoder_id, "libde265");
    EXPECT_EQ(arena.size(), static_cast<size_t>(1));
    EXPECT_EQ(block.color_conversion_options
                  .preferred_chroma_downsampling_algorithm,
              heif_chroma_downsampling_sharp_yuv);
    EXPECT_EQ(
        block.color_conversion_options.preferred_chroma_upsampling_algorithm,
        heif_chroma_upsampling_nearest_neighbor);
    EXPECT_EQ(
        block.color_conversion_options.only_use_preferred_chroma_algorithm, 1);
    EXPECT_TRUE(logged.empty());
}

TEST_F(DecodingOptionsTest, NewerVersion)
{
    // unknown newer versions are filled through the newest known layout
    struct {
        DecodingV5 known;
        uint8_t tail[64];
    } block {};
    block.known.version = 9;
    options.write(&block, arena);

    EXPECT_EQ(block.known.version, 9);
    EXPECT_EQ(block.known.strict_decoding, 1);
    EXPECT_STREQ(block.known.decoder_id, "libde265");
    for (const uint8_t it : block.tail) {
        EXPECT_EQ(it, 0);
    }
}

TEST_F(DecodingOptionsTest, Version4)
{
    DecodingV5 block {};
    block.version = 4;
    options.write(&block, arena);

    EXPECT_EQ(block.ignore_transformations, 1);
    EXPECT_EQ(block.convert_hdr_to_8bit, 1);
    EXPECT_EQ(block.strict_decoding, 1);
    EXPECT_STREQ(block.decoder_id, "libde265");
    // the block is too short for color conversion options
    EXPECT_EQ(block.color_conversion_options
                  .preferred_chroma_downsampling_algorithm,
              0);
    ASSERT_EQ(logged.size(), static_cast<size_t>(1));
    EXPECT_NE(logged[0].find("color_conversion_options"), std::string::npos);
}

TEST_F(DecodingOptionsTest, Version3)
{
    DecodingV5 block {};
    block.version = 3;
    options.write(&block, arena);

    EXPECT_EQ(block.ignore_transformations, 1);
    EXPECT_EQ(block.convert_hdr_to_8bit, 1);
    EXPECT_EQ(block.strict_decoding, 1);
    EXPECT_EQ(block.decoder_id, nullptr);
    EXPECT_EQ(arena.size(), static_cast<size_t>(0));
    EXPECT_EQ(logged.size(), static_cast<size_t>(2));
}

TEST_F(DecodingOptionsTest, Version2)
{
    DecodingV5 block {};
    block.version = 2;
    options.write(&block, arena);

    EXPECT_EQ(block.ignore_transformations, 1);
    EXPECT_EQ(block.convert_hdr_to_8bit, 1);
    EXPECT_EQ(block.strict_decoding, 0);
    EXPECT_EQ(block.decoder_id, nullptr);
    EXPECT_EQ(logged.size(), static_cast<size_t>(3));
}

TEST_F(DecodingOptionsTest, Version1)
{
    DecodingV5 block {};
    block.version = 1;
    options.write(&block, arena);

    EXPECT_EQ(block.ignore_transformations, 1);
    EXPECT_EQ(block.convert_hdr_to_8bit, 0);
    EXPECT_EQ(block.strict_decoding, 0);
    EXPECT_EQ(block.decoder_id, nullptr);
    EXPECT_EQ(logged.size(), static_cast<size_t>(4));
}

TEST_F(DecodingOptionsTest, DefaultsNotReported)
{
    DecodingV5 block {};
    block.version = 1;
    HeifDecodingOptions {}.write(&block, arena);
    EXPECT_EQ(block.ignore_transformations, 0);
    EXPECT_TRUE(logged.empty());
}

TEST_F(DecodingOptionsTest, BlankDecoderId)
{
    DecodingV5 block {};
    block.version = 5;
    options.decoder_id = " \t ";
    options.write(&block, arena);

    EXPECT_EQ(block.decoder_id, nullptr);
    EXPECT_EQ(arena.size(), static_cast<size_t>(0));
}

TEST_F(DecodingOptionsTest, DecoderIdCopied)
{
    DecodingV5 block {};
    block.version = 5;
    options.write(&block, arena);
    options.decoder_id = "dav1d";

    EXPECT_STREQ(block.decoder_id, "libde265");
}

class EncodingOptionsTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        options.save_alpha_channel = false;
        options.crop_with_image_grid = true;
        options.orientation = heif_orientation_rotate_90_cw;
        options.set_two_color_profiles(true);
        options.color_conversion.only_use_preferred = true;
    }

    HeifEncodingOptions options;
};

TEST_F(EncodingOptionsTest, Defaults)
{
    const HeifEncodingOptions defaults;
    EXPECT_TRUE(defaults.save_alpha_channel);
    EXPECT_TRUE(defaults.crop_with_image_grid);
    EXPECT_EQ(defaults.orientation, heif_orientation_normal);
    EXPECT_FALSE(defaults.two_color_profiles());
    EXPECT_FALSE(defaults.nclx_profile());
}

TEST_F(EncodingOptionsTest, ProfilesCoupling)
{
    HeifEncodingOptions opts;

    opts.set_two_color_profiles(true);
    EXPECT_TRUE(opts.two_color_profiles());
    EXPECT_TRUE(opts.nclx_profile());

    opts.set_nclx_profile(false);
    EXPECT_FALSE(opts.nclx_profile());
    EXPECT_FALSE(opts.two_color_profiles());

    opts.set_nclx_profile(true);
    EXPECT_TRUE(opts.nclx_profile());
    EXPECT_FALSE(opts.two_color_profiles());

    opts.set_two_color_profiles(true);
    opts.set_two_color_profiles(false);
    EXPECT_FALSE(opts.two_color_profiles());
    EXPECT_TRUE(opts.nclx_profile());
}

TEST_F(EncodingOptionsTest, Version6)
{
    EncodingV6 block {};
    block.version = 6;
    options.write(&block);

    EXPECT_EQ(block.save_alpha_channel, 0);
    EXPECT_EQ(block.macOS_compatibility_workaround, 1);
    EXPECT_EQ(block.save_two_colr_boxes_when_ICC_and_nclx_available, 1);
    EXPECT_EQ(block.macOS_compatibility_workaround_no_nclx_profile, 0);
    EXPECT_EQ(block.image_orientation, heif_orientation_rotate_90_cw);
    EXPECT_EQ(
        block.color_conversion_options.only_use_preferred_chroma_algorithm, 1);
}

TEST_F(EncodingOptionsTest, Version5)
{
    EncodingV6 block {};
    block.version = 5;
    options.write(&block);

    EXPECT_EQ(block.image_orientation, heif_orientation_rotate_90_cw);
    EXPECT_EQ(
        block.color_conversion_options.only_use_preferred_chroma_algorithm, 0);
}

TEST_F(EncodingOptionsTest, Version4)
{
    EncodingV6 block {};
    block.version = 4;
    options.set_nclx_profile(false);
    options.write(&block);

    EXPECT_EQ(block.save_two_colr_boxes_when_ICC_and_nclx_available, 0);
    EXPECT_EQ(block.macOS_compatibility_workaround_no_nclx_profile, 1);
    EXPECT_EQ(block.image_orientation, 0);
}

TEST_F(EncodingOptionsTest, Version3)
{
    EncodingV6 block {};
    block.version = 3;
    options.write(&block);

    EXPECT_EQ(block.macOS_compatibility_workaround, 1);
    EXPECT_EQ(block.save_two_colr_boxes_when_ICC_and_nclx_available, 1);
    EXPECT_EQ(block.macOS_compatibility_workaround_no_nclx_profile, 0);
}

TEST_F(EncodingOptionsTest, Version2)
{
    EncodingV6 block {};
    block.version = 2;
    options.crop_with_image_grid = false;
    options.write(&block);

    EXPECT_EQ(block.save_alpha_channel, 0);
    EXPECT_EQ(block.macOS_compatibility_workaround, 0);
    EXPECT_EQ(block.save_two_colr_boxes_when_ICC_and_nclx_available, 0);
}

TEST_F(EncodingOptionsTest, Version1)
{
    EncodingV6 block {};
    block.version = 1;
    block.save_alpha_channel = 1;
    options.write(&block);

    EXPECT_EQ(block.save_alpha_channel, 0);
    EXPECT_EQ(block.macOS_compatibility_workaround, 0);
}

TEST(ColorConversionOptionsTest, Defaults)
{
    const HeifColorConversionOptions opts;
    EXPECT_EQ(opts.downsampling, heif_chroma_downsampling_average);
    EXPECT_EQ(opts.upsampling, heif_chroma_upsampling_bilinear);
    EXPECT_FALSE(opts.only_use_preferred);
}

TEST_F(DecodingOptionsTest, NativeBlock)
{
    const NativeDecodingOptions native = options.create();
    const heif_decoding_options* opts = native.get();
    ASSERT_NE(opts, nullptr);
    EXPECT_EQ(opts->version, native.version());
    ASSERT_GE(opts->version, 5);

    // fields are read back through the real structure
    EXPECT_EQ(opts->ignore_transformations, 1);
    EXPECT_EQ(opts->convert_hdr_to_8bit, 1);
    EXPECT_EQ(opts->strict_decoding, 1);
    ASSERT_NE(opts->decoder_id, nullptr);
    EXPECT_STREQ(opts->decoder_id, "libde265");
    EXPECT_EQ(opts->color_conversion_options
                  .preferred_chroma_downsampling_algorithm,
              heif_chroma_downsampling_sharp_yuv);
    EXPECT_EQ(
        opts->color_conversion_options.preferred_chroma_upsampling_algorithm,
        heif_chroma_upsampling_nearest_neighbor);
    EXPECT_EQ(
        opts->color_conversion_options.only_use_preferred_chroma_algorithm, 1);
    EXPECT_TRUE(logged.empty());
}

TEST_F(DecodingOptionsTest, NativeBlockWrite)
{
    std::unique_ptr<heif_decoding_options, decltype(&heif_decoding_options_free)>
        opts(heif_decoding_options_alloc(), &heif_decoding_options_free);
    ASSERT_TRUE(opts);
    ASSERT_GE(opts->version, 5);

    options.write(opts.get(), arena);

    EXPECT_EQ(opts->ignore_transformations, 1);
    EXPECT_EQ(opts->convert_hdr_to_8bit, 1);
    EXPECT_EQ(opts->strict_decoding, 1);
    EXPECT_STREQ(opts->decoder_id, "libde265");
    EXPECT_EQ(
        opts->color_conversion_options.only_use_preferred_chroma_algorithm, 1);
    EXPECT_EQ(arena.size(), static_cast<size_t>(1));
}

TEST_F(EncodingOptionsTest, NativeBlock)
{
    const auto opts = options.create();
    ASSERT_TRUE(opts);
    ASSERT_GE(opts->version, 6);

    EXPECT_EQ(opts->save_alpha_channel, 0);
    EXPECT_EQ(opts->macOS_compatibility_workaround, 1);
    EXPECT_EQ(opts->save_two_colr_boxes_when_ICC_and_nclx_available, 1);
    EXPECT_EQ(opts->macOS_compatibility_workaround_no_nclx_profile, 0);
    EXPECT_EQ(opts->output_nclx_profile, nullptr);
    EXPECT_EQ(opts->image_orientation, heif_orientation_rotate_90_cw);
    EXPECT_EQ(
        opts->color_conversion_options.only_use_preferred_chroma_algorithm, 1);
}

TEST_F(EncodingOptionsTest, NativeBlockWrite)
{
    std::unique_ptr<heif_encoding_options, decltype(&heif_encoding_options_free)>
        opts(heif_encoding_options_alloc(), &heif_encoding_options_free);
    ASSERT_TRUE(opts);
    ASSERT_GE(opts->version, 6);

    options.set_nclx_profile(false);
    options.crop_with_image_grid = false;
    options.write(opts.get());

    EXPECT_EQ(opts->save_alpha_channel, 0);
    EXPECT_EQ(opts->macOS_compatibility_workaround, 0);
    EXPECT_EQ(opts->save_two_colr_boxes_when_ICC_and_nclx_available, 0);
    EXPECT_EQ(opts->macOS_compatibility_workaround_no_nclx_profile, 1);
    EXPECT_EQ(opts->image_orientation, heif_orientation_rotate_90_cw);
}
