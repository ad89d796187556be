// SPDX-License-Identifier: MIT
// Image: decoded pixel planes.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "heifcolorprofile.hpp"

#include <libheif/heif.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

/** Image with pixel planes owned by libheif. */
class HeifImage {
public:
    /** Pixel plane description. */
    struct Plane {
        uint8_t* data;  ///< Pointer to the first row
        int width;      ///< Width in pixels
        int height;     ///< Height in pixels
        int stride;     ///< Size of a single row in bytes
        int bit_depth;  ///< Number of bits per pixel value
    };

    /**
     * Constructor: create empty image without planes.
     * @param width,height image size
     * @param colorspace image color space
     * @param chroma chroma format
     */
    HeifImage(int width, int height, heif_colorspace colorspace,
              heif_chroma chroma);

    /**
     * Constructor: take ownership of native image.
     * @param img native image instance
     */
    explicit HeifImage(heif_image* img);

    /**
     * Get image width.
     * @param channel plane to query
     * @return width in pixels, -1 if channel doesn't exist
     */
    int width(heif_channel channel = heif_channel_interleaved) const;

    /**
     * Get image height.
     * @param channel plane to query
     * @return height in pixels, -1 if channel doesn't exist
     */
    int height(heif_channel channel = heif_channel_interleaved) const;

    /**
     * Get color space.
     * @return image color space
     */
    heif_colorspace colorspace() const;

    /**
     * Get chroma format.
     * @return image chroma format
     */
    heif_chroma chroma() const;

    /**
     * Add new pixel plane.
     * @param channel plane type
     * @param width,height plane size
     * @param bit_depth number of bits per pixel value
     */
    void add_plane(heif_channel channel, int width, int height,
                   int bit_depth);

    /**
     * Check if the image has specified plane.
     * @param channel plane type
     * @return true if plane exists
     */
    bool has_channel(heif_channel channel) const;

    /**
     * Get pixel plane.
     * @param channel plane type
     * @return plane description
     */
    Plane plane(heif_channel channel);

    /**
     * Get ICC color profile.
     * @return raw profile data, empty if not present
     */
    std::vector<uint8_t> icc_profile() const;

    /**
     * Attach ICC color profile.
     * @param data raw profile data
     */
    void set_icc_profile(std::span<const uint8_t> data);

    /**
     * Get NCLX color profile.
     * @return profile, nullopt if not present
     */
    std::optional<HeifNclxProfile> nclx_profile() const;

    /**
     * Attach NCLX color profile.
     * @param profile color profile
     */
    void set_nclx_profile(const HeifNclxProfile& profile);

    /**
     * Get native image instance.
     * @return pointer to native image
     */
    heif_image* get() const { return image.get(); }

private:
    std::unique_ptr<heif_image, decltype(&heif_image_release)> image;
};
