// SPDX-License-Identifier: MIT
// Image handle: image item inside HEIF container.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "heifcolorprofile.hpp"
#include "heifimage.hpp"
#include "heifoptions.hpp"
#include "heifreader.hpp"

#include <libheif/heif.h>

#include <memory>
#include <optional>
#include <vector>

/**
 * Handle of the image item.
 * The handle shares the reader with its context: libheif reads image data
 * lazily, so callbacks can be invoked until the last handle is released.
 */
class HeifImageHandle {
public:
    /**
     * Constructor: take ownership of native handle.
     * @param hdl native handle instance
     * @param src reader used by the context, may be nullptr
     */
    HeifImageHandle(heif_image_handle* hdl, HeifReaderPtr src);

    int width() const;
    int height() const;
    bool has_alpha() const;
    bool is_primary() const;

    /**
     * Get bit depth of luma channel.
     * @return number of bits per pixel, -1 if undefined
     */
    int bit_depth() const;

    /**
     * Get list of thumbnail ids.
     * @return thumbnail ids
     */
    std::vector<heif_item_id> thumbnail_ids() const;

    /**
     * Get thumbnail handle.
     * @param id thumbnail id
     * @return thumbnail handle
     */
    HeifImageHandle thumbnail(heif_item_id id) const;

    /**
     * Get list of metadata block ids.
     * @param type block type filter ("Exif", "mime"), nullptr for all
     * @return metadata block ids
     */
    std::vector<heif_item_id> metadata_ids(const char* type = nullptr) const;

    /**
     * Get metadata block data.
     * @param id metadata block id
     * @return metadata, empty if block is empty
     */
    std::vector<uint8_t> metadata(heif_item_id id) const;

    /**
     * Get EXIF data starting from the TIFF header.
     * Only the first EXIF block is used.
     * @return EXIF data, empty if not present
     */
    std::vector<uint8_t> exif() const;

    /**
     * Get ICC color profile.
     * @return raw profile data, empty if not present
     */
    std::vector<uint8_t> icc_profile() const;

    /**
     * Get NCLX color profile.
     * Image can have both ICC and NCLX profiles.
     * @return profile, nullopt if not present
     */
    std::optional<HeifNclxProfile> nclx_profile() const;

    /**
     * Decode image.
     * @param colorspace output color space
     * @param chroma output chroma format
     * @param options decoding options, nullptr to use defaults
     * @return decoded image
     */
    HeifImage decode(heif_colorspace colorspace, heif_chroma chroma,
                     const HeifDecodingOptions* options = nullptr) const;

    /**
     * Get native handle instance.
     * @return pointer to native handle
     */
    heif_image_handle* get() const { return handle.get(); }

private:
    /**
     * Check result of a call that can read data through the reader.
     * @param err libheif error structure
     */
    void check(const heif_error& err) const;

private:
    HeifReaderPtr reader; ///< Data source, released after the handle
    std::unique_ptr<heif_image_handle, decltype(&heif_image_handle_release)>
        handle;
};
