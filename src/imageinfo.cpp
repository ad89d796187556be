// SPDX-License-Identifier: MIT
// Description of HEIF container content.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "imageinfo.hpp"

#include "heiflibrary.hpp"

#include <format>

using json = nlohmann::json;

namespace ImageInfo {

/**
 * Describe single image.
 * @param id image id
 * @param handle image handle
 * @return image description
 */
static json describe_image(heif_item_id id, const HeifImageHandle& handle)
{
    json image;
    image["id"] = id;
    image["width"] = handle.width();
    image["height"] = handle.height();
    image["bit_depth"] = handle.bit_depth();
    image["alpha"] = handle.has_alpha();
    image["primary"] = handle.is_primary();
    image["thumbnails"] = handle.thumbnail_ids().size();
    image["exif"] = !handle.metadata_ids("Exif").empty();
    image["icc"] = handle.icc_profile().size();
    image["nclx"] = handle.nclx_profile().has_value();
    return image;
}

json describe(const HeifContext& ctx)
{
    json images = json::array();
    for (const heif_item_id id : ctx.top_level_image_ids()) {
        images.push_back(describe_image(id, ctx.image_handle(id)));
    }

    json info;
    info["libheif"] = HeifLibrary::version();
    info["images"] = std::move(images);
    return info;
}

std::string to_text(const json& info)
{
    std::string text;

    const json& images = info["images"];
    text = std::format("Images: {}\n", images.size());

    for (const json& it : images) {
        text += std::format(
            "  #{}{}: {}x{}, {} bit{}",
            it["id"].get<heif_item_id>(),
            it["primary"].get<bool>() ? " (primary)" : "",
            it["width"].get<int>(), it["height"].get<int>(),
            it["bit_depth"].get<int>(),
            it["alpha"].get<bool>() ? ", alpha" : "");
        const size_t thumbnails = it["thumbnails"].get<size_t>();
        if (thumbnails) {
            text += std::format(", {} thumbnail(s)", thumbnails);
        }
        if (it["exif"].get<bool>()) {
            text += ", EXIF";
        }
        const size_t icc = it.value("icc", static_cast<size_t>(0));
        if (icc) {
            text += std::format(", ICC {} bytes", icc);
        }
        if (it.value("nclx", false)) {
            text += ", NCLX";
        }
        text += '\n';
    }

    return text;
}

}; // namespace ImageInfo
