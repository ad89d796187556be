// SPDX-License-Identifier: MIT
// libheif runtime information.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include <libheif/heif.h>

#include <cstdint>
#include <string>
#include <vector>

/** Decoder plugin description. */
struct HeifDecoderDescriptor {
    std::string id;   ///< Short identifier, used as decoder_id option
    std::string name; ///< Human readable name
};

/** Encoder plugin description. */
struct HeifEncoderDescriptor {
    std::string id;                 ///< Short identifier
    std::string name;               ///< Human readable name
    heif_compression_format format; ///< Compression format
    bool lossy;                     ///< Lossy compression supported
    bool lossless;                  ///< Lossless compression supported
    const heif_encoder_descriptor* native; ///< Owned by libheif
};

/** libheif library loaded at runtime. */
class HeifLibrary {
public:
    /** Library initialization guard: heif_init/heif_deinit pair. */
    class Guard {
    public:
        Guard();
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
    };

    /**
     * Get version number of the loaded library.
     * @return version in format 0xHHMMLL00
     */
    static uint32_t version_number();

    /**
     * Get version of the loaded library as text.
     * @return version string
     */
    static std::string version();

    /**
     * Check if the loaded library is new enough.
     * @return true if library is supported
     */
    static bool supported();

    /**
     * Throw HeifError if the loaded library is too old.
     */
    static void check_supported();

    /**
     * Check if the library can write both ICC and NCLX color profiles.
     * @return true if feature is supported (libheif 1.10+)
     */
    static bool can_write_two_color_profiles();

    /**
     * Check if decoder is available for the format.
     * @param format compression format
     * @return true if decoder is available
     */
    static bool have_decoder(heif_compression_format format);

    /**
     * Check if encoder is available for the format.
     * @param format compression format
     * @return true if encoder is available
     */
    static bool have_encoder(heif_compression_format format);

    /**
     * Get list of available decoders.
     * @param format compression format, heif_compression_undefined for all
     * @return decoder descriptors
     */
    static std::vector<HeifDecoderDescriptor>
    decoder_descriptors(heif_compression_format format =
                            heif_compression_undefined);

    /**
     * Get list of available encoders.
     * @param format compression format, heif_compression_undefined for all
     * @param name_filter encoder id filter, nullptr for all
     * @return encoder descriptors
     */
    static std::vector<HeifEncoderDescriptor>
    encoder_descriptors(heif_compression_format format =
                            heif_compression_undefined,
                        const char* name_filter = nullptr);
};
