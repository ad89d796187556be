// SPDX-License-Identifier: MIT
// Color profiles attached to images.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "heifcolorprofile.hpp"

#include "heiferror.hpp"

HeifNclxProfile HeifNclxProfile::from_native(const heif_color_profile_nclx& nclx)
{
    HeifNclxProfile profile;
    profile.color_primaries = nclx.color_primaries;
    profile.transfer_characteristics = nclx.transfer_characteristics;
    profile.matrix_coefficients = nclx.matrix_coefficients;
    profile.full_range = nclx.full_range_flag != 0;
    return profile;
}

std::unique_ptr<heif_color_profile_nclx,
                decltype(&heif_nclx_color_profile_free)>
HeifNclxProfile::to_native() const
{
    std::unique_ptr<heif_color_profile_nclx,
                    decltype(&heif_nclx_color_profile_free)>
        nclx(heif_nclx_color_profile_alloc(), &heif_nclx_color_profile_free);
    if (!nclx) {
        throw HeifError("Unable to create NCLX color profile",
                        heif_error_Memory_allocation_error);
    }

    nclx->color_primaries = color_primaries;
    nclx->transfer_characteristics = transfer_characteristics;
    nclx->matrix_coefficients = matrix_coefficients;
    nclx->full_range_flag = full_range ? 1 : 0;

    return nclx;
}
