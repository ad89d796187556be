// SPDX-License-Identifier: MIT
// Image handle: image item inside HEIF container.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "heifimagehandle.hpp"

#include "heiferror.hpp"
#include "log.hpp"

#include <stdexcept>

// EXIF block starts with big-endian offset to the TIFF header
static constexpr size_t EXIF_OFFSET_SIZE = 4;

HeifImageHandle::HeifImageHandle(heif_image_handle* hdl, HeifReaderPtr src)
    : reader(std::move(src))
    , handle(hdl, &heif_image_handle_release)
{
    if (!handle) {
        throw std::invalid_argument("Image handle is not specified");
    }
}

int HeifImageHandle::width() const
{
    return heif_image_handle_get_width(handle.get());
}

int HeifImageHandle::height() const
{
    return heif_image_handle_get_height(handle.get());
}

bool HeifImageHandle::has_alpha() const
{
    return heif_image_handle_has_alpha_channel(handle.get()) != 0;
}

bool HeifImageHandle::is_primary() const
{
    return heif_image_handle_is_primary_image(handle.get()) != 0;
}

int HeifImageHandle::bit_depth() const
{
    return heif_image_handle_get_luma_bits_per_pixel(handle.get());
}

std::vector<heif_item_id> HeifImageHandle::thumbnail_ids() const
{
    const int count = heif_image_handle_get_number_of_thumbnails(handle.get());
    if (count <= 0) {
        return {};
    }

    std::vector<heif_item_id> ids(count);
    const int filled = heif_image_handle_get_list_of_thumbnail_IDs(
        handle.get(), ids.data(), count);
    ids.resize(filled);

    return ids;
}

HeifImageHandle HeifImageHandle::thumbnail(heif_item_id id) const
{
    heif_image_handle* thumb = nullptr;
    check(heif_image_handle_get_thumbnail(handle.get(), id, &thumb));
    return HeifImageHandle(thumb, reader);
}

std::vector<heif_item_id> HeifImageHandle::metadata_ids(const char* type) const
{
    const int count =
        heif_image_handle_get_number_of_metadata_blocks(handle.get(), type);
    if (count <= 0) {
        return {};
    }

    std::vector<heif_item_id> ids(count);
    const int filled = heif_image_handle_get_list_of_metadata_block_IDs(
        handle.get(), type, ids.data(), count);
    ids.resize(filled);

    return ids;
}

std::vector<uint8_t> HeifImageHandle::metadata(heif_item_id id) const
{
    const size_t size = heif_image_handle_get_metadata_size(handle.get(), id);
    if (size == 0) {
        return {};
    }

    std::vector<uint8_t> data(size);
    check(heif_image_handle_get_metadata(handle.get(), id, data.data()));

    return data;
}

std::vector<uint8_t> HeifImageHandle::exif() const
{
    const std::vector<heif_item_id> ids = metadata_ids("Exif");
    if (ids.empty()) {
        return {};
    }

    const std::vector<uint8_t> block = metadata(ids[0]);
    if (block.size() <= EXIF_OFFSET_SIZE) {
        return {};
    }

    const size_t offset = (static_cast<size_t>(block[0]) << 24) |
        (static_cast<size_t>(block[1]) << 16) |
        (static_cast<size_t>(block[2]) << 8) | block[3];
    if (offset >= block.size() - EXIF_OFFSET_SIZE) {
        Log::warning("Invalid TIFF header offset in EXIF block: {}", offset);
        return {};
    }

    return std::vector<uint8_t>(
        block.begin() + EXIF_OFFSET_SIZE + offset, block.end());
}

std::vector<uint8_t> HeifImageHandle::icc_profile() const
{
    const size_t size =
        heif_image_handle_get_raw_color_profile_size(handle.get());
    if (size == 0) {
        return {};
    }

    std::vector<uint8_t> data(size);
    check(heif_image_handle_get_raw_color_profile(handle.get(), data.data()));

    return data;
}

std::optional<HeifNclxProfile> HeifImageHandle::nclx_profile() const
{
    heif_color_profile_nclx* nclx = nullptr;
    const heif_error err =
        heif_image_handle_get_nclx_color_profile(handle.get(), &nclx);
    std::unique_ptr<heif_color_profile_nclx,
                    decltype(&heif_nclx_color_profile_free)>
        guard(nclx, &heif_nclx_color_profile_free);

    if (err.code == heif_error_Color_profile_does_not_exist) {
        return std::nullopt;
    }
    check(err);

    return HeifNclxProfile::from_native(*guard);
}

HeifImage HeifImageHandle::decode(heif_colorspace colorspace,
                                  heif_chroma chroma,
                                  const HeifDecodingOptions* options) const
{
    heif_image* img = nullptr;
    heif_error err;

    if (options) {
        // native options and their strings live until decoding is done
        const NativeDecodingOptions native = options->create();
        err = heif_decode_image(handle.get(), &img, colorspace, chroma,
                                native.get());
    } else {
        err = heif_decode_image(handle.get(), &img, colorspace, chroma,
                                nullptr);
    }

    // take ownership before error check to release partial result
    std::unique_ptr<heif_image, decltype(&heif_image_release)> guard(
        img, &heif_image_release);
    check(err);

    return HeifImage(guard.release());
}

void HeifImageHandle::check(const heif_error& err) const
{
    HeifError::check(err, reader ? &reader->callback_error() : nullptr);
}
