// SPDX-License-Identifier: MIT
// Decoding and encoding options.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "heifoptions.hpp"

#include "heiferror.hpp"
#include "log.hpp"
#include "nativelayout.hpp"

using namespace NativeLayout;

/**
 * Write chroma conversion preferences.
 * @param dst native structure
 * @param src chroma conversion preferences
 */
static void write_color_conversion(ColorConversionV1& dst,
                                   const HeifColorConversionOptions& src)
{
    dst.preferred_chroma_downsampling_algorithm = src.downsampling;
    dst.preferred_chroma_upsampling_algorithm = src.upsampling;
    dst.only_use_preferred_chroma_algorithm = src.only_use_preferred;
}

/**
 * Report option dropped because of old native structure version.
 * @param name option name
 * @param version native structure version
 */
static void dropped(const char* name, uint8_t version)
{
    Log::debug("Option \"{}\" is not supported by options version {}, "
               "ignored",
               name, version);
}

NativeDecodingOptions::NativeDecodingOptions(Options&& opts, NativeArena&& mem)
    : arena(std::move(mem))
    , options(std::move(opts))
{
}

uint8_t NativeDecodingOptions::version() const
{
    return reinterpret_cast<const DecodingV1*>(options.get())->version;
}

NativeDecodingOptions HeifDecodingOptions::create() const
{
    NativeDecodingOptions::Options opts(heif_decoding_options_alloc(),
                                        &heif_decoding_options_free);
    if (!opts) {
        throw HeifError("Unable to create decoding options",
                        heif_error_Memory_allocation_error);
    }

    NativeArena arena;
    write(opts.get(), arena);

    return NativeDecodingOptions(std::move(opts), std::move(arena));
}

void HeifDecodingOptions::write(void* block, NativeArena& arena) const
{
    DecodingV1* v1 = static_cast<DecodingV1*>(block);
    v1->ignore_transformations = ignore_transformations;

    const uint8_t version = v1->version;
    const bool has_decoder =
        decoder_id.find_first_not_of(" \t\r\n\v\f") != std::string::npos;
    const bool has_conversion =
        color_conversion != HeifColorConversionOptions {};

    if (version >= 5) {
        DecodingV5* opts = static_cast<DecodingV5*>(block);
        opts->convert_hdr_to_8bit = convert_hdr_to_8bit;
        opts->strict_decoding = strict;
        if (has_decoder) {
            opts->decoder_id = arena.copy(decoder_id);
        }
        write_color_conversion(opts->color_conversion_options,
                               color_conversion);
    } else if (version == 4) {
        DecodingV4* opts = static_cast<DecodingV4*>(block);
        opts->convert_hdr_to_8bit = convert_hdr_to_8bit;
        opts->strict_decoding = strict;
        if (has_decoder) {
            opts->decoder_id = arena.copy(decoder_id);
        }
    } else if (version == 3) {
        DecodingV3* opts = static_cast<DecodingV3*>(block);
        opts->convert_hdr_to_8bit = convert_hdr_to_8bit;
        opts->strict_decoding = strict;
    } else if (version == 2) {
        DecodingV2* opts = static_cast<DecodingV2*>(block);
        opts->convert_hdr_to_8bit = convert_hdr_to_8bit;
    }

    if (version < 2 && convert_hdr_to_8bit) {
        dropped("convert_hdr_to_8bit", version);
    }
    if (version < 3 && strict) {
        dropped("strict_decoding", version);
    }
    if (version < 4 && has_decoder) {
        dropped("decoder_id", version);
    }
    if (version < 5 && has_conversion) {
        dropped("color_conversion_options", version);
    }
}

void HeifEncodingOptions::set_two_color_profiles(bool enable)
{
    two_profiles = enable;
    if (enable) {
        nclx = true;
    }
}

void HeifEncodingOptions::set_nclx_profile(bool enable)
{
    nclx = enable;
    if (!enable) {
        two_profiles = false;
    }
}

std::unique_ptr<heif_encoding_options, decltype(&heif_encoding_options_free)>
HeifEncodingOptions::create() const
{
    std::unique_ptr<heif_encoding_options,
                    decltype(&heif_encoding_options_free)>
        opts(heif_encoding_options_alloc(), &heif_encoding_options_free);
    if (!opts) {
        throw HeifError("Unable to create encoding options",
                        heif_error_Memory_allocation_error);
    }

    write(opts.get());

    return opts;
}

void HeifEncodingOptions::write(void* block) const
{
    EncodingV1* v1 = static_cast<EncodingV1*>(block);
    v1->save_alpha_channel = save_alpha_channel;

    const uint8_t version = v1->version;

    if (version >= 6) {
        EncodingV6* opts = static_cast<EncodingV6*>(block);
        opts->macOS_compatibility_workaround = crop_with_image_grid;
        opts->save_two_colr_boxes_when_ICC_and_nclx_available = two_profiles;
        opts->macOS_compatibility_workaround_no_nclx_profile = !nclx;
        opts->image_orientation = orientation;
        write_color_conversion(opts->color_conversion_options,
                               color_conversion);
    } else if (version == 5) {
        EncodingV5* opts = static_cast<EncodingV5*>(block);
        opts->macOS_compatibility_workaround = crop_with_image_grid;
        opts->save_two_colr_boxes_when_ICC_and_nclx_available = two_profiles;
        opts->macOS_compatibility_workaround_no_nclx_profile = !nclx;
        opts->image_orientation = orientation;
    } else if (version == 4) {
        EncodingV4* opts = static_cast<EncodingV4*>(block);
        opts->macOS_compatibility_workaround = crop_with_image_grid;
        opts->save_two_colr_boxes_when_ICC_and_nclx_available = two_profiles;
        opts->macOS_compatibility_workaround_no_nclx_profile = !nclx;
    } else if (version == 3) {
        EncodingV3* opts = static_cast<EncodingV3*>(block);
        opts->macOS_compatibility_workaround = crop_with_image_grid;
        opts->save_two_colr_boxes_when_ICC_and_nclx_available = two_profiles;
    } else if (version == 2) {
        EncodingV2* opts = static_cast<EncodingV2*>(block);
        opts->macOS_compatibility_workaround = crop_with_image_grid;
    }

    if (version < 3 && two_profiles) {
        dropped("save_two_colr_boxes_when_ICC_and_nclx_available", version);
    }
    if (version < 4 && nclx) {
        dropped("nclx_profile", version);
    }
    if (version < 5 && orientation != heif_orientation_normal) {
        dropped("image_orientation", version);
    }
    if (version < 6 && color_conversion != HeifColorConversionOptions {}) {
        dropped("color_conversion_options", version);
    }
}
