// SPDX-License-Identifier: MIT
// Decoding and encoding options.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "nativearena.hpp"

#include <libheif/heif.h>

#include <memory>
#include <string>

/** Chroma conversion preferences. */
struct HeifColorConversionOptions {
    heif_chroma_downsampling_algorithm downsampling =
        heif_chroma_downsampling_average; ///< Preferred downsampling
    heif_chroma_upsampling_algorithm upsampling =
        heif_chroma_upsampling_bilinear; ///< Preferred upsampling
    bool only_use_preferred = false;     ///< Don't fall back to others

    bool operator==(const HeifColorConversionOptions&) const = default;
};

/** Native decoding options block with its dependent allocations. */
class NativeDecodingOptions {
public:
    /**
     * Get native options block.
     * @return pointer to pass to libheif
     */
    heif_decoding_options* get() const { return options.get(); }

    /**
     * Get version of the options block reported by libheif.
     * @return layout version
     */
    uint8_t version() const;

private:
    friend struct HeifDecodingOptions;

    using Options = std::unique_ptr<heif_decoding_options,
                                    decltype(&heif_decoding_options_free)>;

    NativeDecodingOptions(Options&& opts, NativeArena&& mem);

    NativeArena arena; ///< Strings referenced by the options block
    Options options;   ///< Options block allocated by libheif
};

/** Options used for decoding images. */
struct HeifDecodingOptions {
    bool ignore_transformations = false; ///< Skip crop, rotation, mirroring
    bool convert_hdr_to_8bit = false;    ///< Decode HDR images to 8 bit
    bool strict = false;                 ///< Fail on invalid input
    std::string decoder_id;              ///< Decoder plugin id, empty=auto
    HeifColorConversionOptions color_conversion; ///< Chroma conversion

    /**
     * Allocate native options block and fill it.
     * @return native options, must outlive the native call
     */
    NativeDecodingOptions create() const;

    /**
     * Fill native options block according to its version.
     * Options not supported by the block version are skipped.
     * @param block native options block allocated by libheif
     * @param arena storage for dependent allocations
     */
    void write(void* block, NativeArena& arena) const;
};

/** Options used for encoding images. */
class HeifEncodingOptions {
public:
    bool save_alpha_channel = true;   ///< Write alpha channel
    bool crop_with_image_grid = true; ///< Crop with grid instead of 'clap'
    heif_orientation orientation = heif_orientation_normal; ///< Orientation
    HeifColorConversionOptions color_conversion; ///< Chroma conversion

    /**
     * Write both ICC and NCLX color profiles if both are present.
     * Enabling it also enables NCLX profile.
     * @param enable new state
     */
    void set_two_color_profiles(bool enable);

    /**
     * Get state of "two color profiles" option.
     * @return true if both profiles are written
     */
    bool two_color_profiles() const { return two_profiles; }

    /**
     * Write NCLX color profile.
     * Disabling it also disables "two color profiles".
     * @param enable new state
     */
    void set_nclx_profile(bool enable);

    /**
     * Get state of "NCLX profile" option.
     * @return true if NCLX profile is written
     */
    bool nclx_profile() const { return nclx; }

    /**
     * Allocate native options block and fill it.
     * @return native options, must outlive the native call
     */
    std::unique_ptr<heif_encoding_options,
                    decltype(&heif_encoding_options_free)>
    create() const;

    /**
     * Fill native options block according to its version.
     * Options not supported by the block version are skipped.
     * @param block native options block allocated by libheif
     */
    void write(void* block) const;

private:
    bool two_profiles = false;
    bool nclx = false;
};
