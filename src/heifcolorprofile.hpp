// SPDX-License-Identifier: MIT
// Color profiles attached to images.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include <libheif/heif.h>

#include <memory>

/** NCLX color profile: color description by code points. */
struct HeifNclxProfile {
    heif_color_primaries color_primaries =
        heif_color_primaries_ITU_R_BT_709_5;
    heif_transfer_characteristics transfer_characteristics =
        heif_transfer_characteristic_IEC_61966_2_1;
    heif_matrix_coefficients matrix_coefficients =
        heif_matrix_coefficients_ITU_R_BT_601_6;
    bool full_range = true;

    bool operator==(const HeifNclxProfile&) const = default;

    /**
     * Create profile from native description.
     * @param nclx native profile
     * @return profile
     */
    static HeifNclxProfile from_native(const heif_color_profile_nclx& nclx);

    /**
     * Allocate native profile and fill it.
     * @return native profile
     */
    std::unique_ptr<heif_color_profile_nclx,
                    decltype(&heif_nclx_color_profile_free)>
    to_native() const;
};

// FourCC of ICC profile data
constexpr const char* ICC_PROFILE_TYPE = "prof";
