// SPDX-License-Identifier: MIT
// libheif runtime information.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "heiflibrary.hpp"

#include "buildconf.hpp"
#include "heiferror.hpp"
#include "log.hpp"

#include <format>

// Version with support for two color profiles (1.10.0)
static constexpr uint32_t TWO_COLOR_PROFILES_VERSION = 0x010a0000;

HeifLibrary::Guard::Guard()
{
    HeifError::check(heif_init(nullptr));
    Log::debug("libheif {} initialized", HeifLibrary::version());
}

HeifLibrary::Guard::~Guard()
{
    heif_deinit();
}

uint32_t HeifLibrary::version_number()
{
    return heif_get_version_number();
}

std::string HeifLibrary::version()
{
    const char* ver = heif_get_version();
    return ver ? ver : "";
}

bool HeifLibrary::supported()
{
    return version_number() >= LIBHEIF_MIN_VERSION;
}

void HeifLibrary::check_supported()
{
    if (!supported()) {
        throw HeifError(
            std::format("libheif {} is not supported, version {}.{}.{} or "
                        "later required",
                        version(), (LIBHEIF_MIN_VERSION >> 24) & 0xff,
                        (LIBHEIF_MIN_VERSION >> 16) & 0xff,
                        (LIBHEIF_MIN_VERSION >> 8) & 0xff),
            heif_error_Unsupported_feature);
    }
}

bool HeifLibrary::can_write_two_color_profiles()
{
    return version_number() >= TWO_COLOR_PROFILES_VERSION;
}

bool HeifLibrary::have_decoder(heif_compression_format format)
{
    return heif_have_decoder_for_format(format) != 0;
}

bool HeifLibrary::have_encoder(heif_compression_format format)
{
    return heif_have_encoder_for_format(format) != 0;
}

std::vector<HeifDecoderDescriptor>
HeifLibrary::decoder_descriptors(heif_compression_format format)
{
    const int count = heif_get_decoder_descriptors(format, nullptr, 0);
    if (count <= 0) {
        return {};
    }

    std::vector<const heif_decoder_descriptor*> native(count);
    const int filled =
        heif_get_decoder_descriptors(format, native.data(), count);
    if (filled != count) {
        throw HeifError("Unable to get decoder descriptors",
                        heif_error_Plugin_loading_error);
    }

    std::vector<HeifDecoderDescriptor> list;
    list.reserve(count);
    for (const heif_decoder_descriptor* desc : native) {
        const char* id = heif_decoder_descriptor_get_id_name(desc);
        const char* name = heif_decoder_descriptor_get_name(desc);
        list.push_back({ id ? id : "", name ? name : "" });
    }

    return list;
}

std::vector<HeifEncoderDescriptor>
HeifLibrary::encoder_descriptors(heif_compression_format format,
                                 const char* name_filter)
{
    const int count =
        heif_get_encoder_descriptors(format, name_filter, nullptr, 0);
    if (count <= 0) {
        return {};
    }

    std::vector<const heif_encoder_descriptor*> native(count);
    const int filled =
        heif_get_encoder_descriptors(format, name_filter, native.data(), count);
    if (filled != count) {
        throw HeifError("Unable to get encoder descriptors",
                        heif_error_Plugin_loading_error);
    }

    std::vector<HeifEncoderDescriptor> list;
    list.reserve(count);
    for (const heif_encoder_descriptor* desc : native) {
        const char* id = heif_encoder_descriptor_get_id_name(desc);
        const char* name = heif_encoder_descriptor_get_name(desc);
        list.push_back({
            .id = id ? id : "",
            .name = name ? name : "",
            .format = heif_encoder_descriptor_get_compression_format(desc),
            .lossy = heif_encoder_descriptor_supports_lossy_compression(desc) != 0,
            .lossless =
                heif_encoder_descriptor_supports_lossless_compression(desc) != 0,
            .native = desc,
        });
    }

    return list;
}
