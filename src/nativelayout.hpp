// SPDX-License-Identifier: MIT
// Memory layouts of versioned libheif option blocks.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include <libheif/heif.h>

#include <cstddef>
#include <cstdint>

/**
 * libheif extends its option structures by appending fields and bumping
 * the version byte at offset 0. The runtime library may be older or newer
 * than the headers we are built with, so the blocks allocated by libheif
 * are accessed through the layout matching the version it reports.
 * Each layout repeats all fields of the previous one.
 */
namespace NativeLayout {

/** heif_color_conversion_options, version 1. */
struct ColorConversionV1 {
    uint8_t version;
    int32_t preferred_chroma_downsampling_algorithm;
    int32_t preferred_chroma_upsampling_algorithm;
    uint8_t only_use_preferred_chroma_algorithm;
};

// heif_decoding_options

struct DecodingV1 {
    uint8_t version;
    uint8_t ignore_transformations;
    void* start_progress;
    void* on_progress;
    void* end_progress;
    void* progress_user_data;
};

struct DecodingV2 {
    uint8_t version;
    uint8_t ignore_transformations;
    void* start_progress;
    void* on_progress;
    void* end_progress;
    void* progress_user_data;
    uint8_t convert_hdr_to_8bit;
};

struct DecodingV3 {
    uint8_t version;
    uint8_t ignore_transformations;
    void* start_progress;
    void* on_progress;
    void* end_progress;
    void* progress_user_data;
    uint8_t convert_hdr_to_8bit;
    uint8_t strict_decoding;
};

struct DecodingV4 {
    uint8_t version;
    uint8_t ignore_transformations;
    void* start_progress;
    void* on_progress;
    void* end_progress;
    void* progress_user_data;
    uint8_t convert_hdr_to_8bit;
    uint8_t strict_decoding;
    const char* decoder_id;
};

struct DecodingV5 {
    uint8_t version;
    uint8_t ignore_transformations;
    void* start_progress;
    void* on_progress;
    void* end_progress;
    void* progress_user_data;
    uint8_t convert_hdr_to_8bit;
    uint8_t strict_decoding;
    const char* decoder_id;
    ColorConversionV1 color_conversion_options;
};

// heif_encoding_options

struct EncodingV1 {
    uint8_t version;
    uint8_t save_alpha_channel;
};

struct EncodingV2 {
    uint8_t version;
    uint8_t save_alpha_channel;
    uint8_t macOS_compatibility_workaround;
};

struct EncodingV3 {
    uint8_t version;
    uint8_t save_alpha_channel;
    uint8_t macOS_compatibility_workaround;
    uint8_t save_two_colr_boxes_when_ICC_and_nclx_available;
};

struct EncodingV4 {
    uint8_t version;
    uint8_t save_alpha_channel;
    uint8_t macOS_compatibility_workaround;
    uint8_t save_two_colr_boxes_when_ICC_and_nclx_available;
    void* output_nclx_profile;
    uint8_t macOS_compatibility_workaround_no_nclx_profile;
};

struct EncodingV5 {
    uint8_t version;
    uint8_t save_alpha_channel;
    uint8_t macOS_compatibility_workaround;
    uint8_t save_two_colr_boxes_when_ICC_and_nclx_available;
    void* output_nclx_profile;
    uint8_t macOS_compatibility_workaround_no_nclx_profile;
    int32_t image_orientation;
};

struct EncodingV6 {
    uint8_t version;
    uint8_t save_alpha_channel;
    uint8_t macOS_compatibility_workaround;
    uint8_t save_two_colr_boxes_when_ICC_and_nclx_available;
    void* output_nclx_profile;
    uint8_t macOS_compatibility_workaround_no_nclx_profile;
    int32_t image_orientation;
    ColorConversionV1 color_conversion_options;
};

// newer layouts only append fields
static_assert(offsetof(DecodingV5, progress_user_data) ==
              offsetof(DecodingV1, progress_user_data));
static_assert(offsetof(DecodingV5, convert_hdr_to_8bit) ==
              offsetof(DecodingV2, convert_hdr_to_8bit));
static_assert(offsetof(DecodingV5, strict_decoding) ==
              offsetof(DecodingV3, strict_decoding));
static_assert(offsetof(DecodingV5, decoder_id) ==
              offsetof(DecodingV4, decoder_id));
static_assert(offsetof(EncodingV6, macOS_compatibility_workaround) ==
              offsetof(EncodingV2, macOS_compatibility_workaround));
static_assert(
    offsetof(EncodingV6, save_two_colr_boxes_when_ICC_and_nclx_available) ==
    offsetof(EncodingV3, save_two_colr_boxes_when_ICC_and_nclx_available));
static_assert(
    offsetof(EncodingV6, macOS_compatibility_workaround_no_nclx_profile) ==
    offsetof(EncodingV4, macOS_compatibility_workaround_no_nclx_profile));
static_assert(offsetof(EncodingV6, image_orientation) ==
              offsetof(EncodingV5, image_orientation));

// enums are stored as int32_t
static_assert(sizeof(heif_orientation) == sizeof(int32_t));
static_assert(sizeof(heif_chroma_downsampling_algorithm) == sizeof(int32_t));
static_assert(sizeof(heif_chroma_upsampling_algorithm) == sizeof(int32_t));

// mirrors must match the headers we are built with (libheif 1.16+)
static_assert(offsetof(heif_color_conversion_options,
                       preferred_chroma_downsampling_algorithm) ==
              offsetof(ColorConversionV1,
                       preferred_chroma_downsampling_algorithm));
static_assert(offsetof(heif_color_conversion_options,
                       preferred_chroma_upsampling_algorithm) ==
              offsetof(ColorConversionV1,
                       preferred_chroma_upsampling_algorithm));
static_assert(offsetof(heif_color_conversion_options,
                       only_use_preferred_chroma_algorithm) ==
              offsetof(ColorConversionV1, only_use_preferred_chroma_algorithm));

static_assert(offsetof(heif_decoding_options, ignore_transformations) ==
              offsetof(DecodingV5, ignore_transformations));
static_assert(offsetof(heif_decoding_options, start_progress) ==
              offsetof(DecodingV5, start_progress));
static_assert(offsetof(heif_decoding_options, on_progress) ==
              offsetof(DecodingV5, on_progress));
static_assert(offsetof(heif_decoding_options, end_progress) ==
              offsetof(DecodingV5, end_progress));
static_assert(offsetof(heif_decoding_options, progress_user_data) ==
              offsetof(DecodingV5, progress_user_data));
static_assert(offsetof(heif_decoding_options, convert_hdr_to_8bit) ==
              offsetof(DecodingV5, convert_hdr_to_8bit));
static_assert(offsetof(heif_decoding_options, strict_decoding) ==
              offsetof(DecodingV5, strict_decoding));
static_assert(offsetof(heif_decoding_options, decoder_id) ==
              offsetof(DecodingV5, decoder_id));
static_assert(offsetof(heif_decoding_options, color_conversion_options) ==
              offsetof(DecodingV5, color_conversion_options));

static_assert(offsetof(heif_encoding_options, save_alpha_channel) ==
              offsetof(EncodingV6, save_alpha_channel));
static_assert(offsetof(heif_encoding_options, macOS_compatibility_workaround) ==
              offsetof(EncodingV6, macOS_compatibility_workaround));
static_assert(
    offsetof(heif_encoding_options,
             save_two_colr_boxes_when_ICC_and_nclx_available) ==
    offsetof(EncodingV6, save_two_colr_boxes_when_ICC_and_nclx_available));
static_assert(offsetof(heif_encoding_options, output_nclx_profile) ==
              offsetof(EncodingV6, output_nclx_profile));
static_assert(
    offsetof(heif_encoding_options,
             macOS_compatibility_workaround_no_nclx_profile) ==
    offsetof(EncodingV6, macOS_compatibility_workaround_no_nclx_profile));
static_assert(offsetof(heif_encoding_options, image_orientation) ==
              offsetof(EncodingV6, image_orientation));
static_assert(offsetof(heif_encoding_options, color_conversion_options) ==
              offsetof(EncodingV6, color_conversion_options));

} // namespace NativeLayout
