// SPDX-License-Identifier: MIT
// Description of HEIF container content.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "heifcontext.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace ImageInfo {

/**
 * Describe top level images of the context.
 * @param ctx context with data read
 * @return description in json format
 */
nlohmann::json describe(const HeifContext& ctx);

/**
 * Convert description to human readable text.
 * @param info description created by describe()
 * @return multi-line text
 */
std::string to_text(const nlohmann::json& info);

}; // namespace ImageInfo
