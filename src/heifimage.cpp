// SPDX-License-Identifier: MIT
// Image: decoded pixel planes.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "heifimage.hpp"

#include "heiferror.hpp"

#include <format>
#include <stdexcept>

HeifImage::HeifImage(int width, int height, heif_colorspace colorspace,
                     heif_chroma chroma)
    : image(nullptr, &heif_image_release)
{
    if (width <= 0 || height <= 0) {
        throw std::out_of_range(
            std::format("Invalid image size {}x{}", width, height));
    }

    heif_image* img = nullptr;
    HeifError::check(heif_image_create(width, height, colorspace, chroma, &img));
    image.reset(img);
}

HeifImage::HeifImage(heif_image* img)
    : image(img, &heif_image_release)
{
    if (!image) {
        throw std::invalid_argument("Image is not specified");
    }
}

int HeifImage::width(heif_channel channel) const
{
    return heif_image_get_width(image.get(), channel);
}

int HeifImage::height(heif_channel channel) const
{
    return heif_image_get_height(image.get(), channel);
}

heif_colorspace HeifImage::colorspace() const
{
    return heif_image_get_colorspace(image.get());
}

heif_chroma HeifImage::chroma() const
{
    return heif_image_get_chroma_format(image.get());
}

void HeifImage::add_plane(heif_channel channel, int width, int height,
                          int bit_depth)
{
    if (width <= 0 || height <= 0) {
        throw std::out_of_range(
            std::format("Invalid plane size {}x{}", width, height));
    }
    HeifError::check(
        heif_image_add_plane(image.get(), channel, width, height, bit_depth));
}

bool HeifImage::has_channel(heif_channel channel) const
{
    return heif_image_has_channel(image.get(), channel) != 0;
}

HeifImage::Plane HeifImage::plane(heif_channel channel)
{
    if (!has_channel(channel)) {
        throw std::invalid_argument(
            std::format("Image doesn't have channel {}",
                        static_cast<int>(channel)));
    }

    Plane pl;
    pl.data = heif_image_get_plane(image.get(), channel, &pl.stride);
    if (!pl.data) {
        throw HeifError("Unable to get image plane");
    }
    pl.width = heif_image_get_width(image.get(), channel);
    pl.height = heif_image_get_height(image.get(), channel);
    pl.bit_depth = heif_image_get_bits_per_pixel_range(image.get(), channel);

    return pl;
}

std::vector<uint8_t> HeifImage::icc_profile() const
{
    const size_t size = heif_image_get_raw_color_profile_size(image.get());
    if (size == 0) {
        return {};
    }

    std::vector<uint8_t> data(size);
    HeifError::check(
        heif_image_get_raw_color_profile(image.get(), data.data()));

    return data;
}

void HeifImage::set_icc_profile(std::span<const uint8_t> data)
{
    if (data.empty()) {
        throw std::invalid_argument("ICC profile is empty");
    }
    HeifError::check(heif_image_set_raw_color_profile(
        image.get(), ICC_PROFILE_TYPE, data.data(), data.size()));
}

std::optional<HeifNclxProfile> HeifImage::nclx_profile() const
{
    heif_color_profile_nclx* nclx = nullptr;
    const heif_error err =
        heif_image_get_nclx_color_profile(image.get(), &nclx);
    std::unique_ptr<heif_color_profile_nclx,
                    decltype(&heif_nclx_color_profile_free)>
        guard(nclx, &heif_nclx_color_profile_free);

    if (err.code == heif_error_Color_profile_does_not_exist) {
        return std::nullopt;
    }
    HeifError::check(err);

    return HeifNclxProfile::from_native(*guard);
}

void HeifImage::set_nclx_profile(const HeifNclxProfile& profile)
{
    const auto nclx = profile.to_native();
    HeifError::check(heif_image_set_nclx_color_profile(image.get(), nclx.get()));
}
