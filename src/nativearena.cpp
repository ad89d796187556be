// SPDX-License-Identifier: MIT
// Memory handed to libheif for the duration of a native call.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "nativearena.hpp"

#include <cstring>

const char* NativeArena::copy(std::string_view str)
{
    auto block = std::make_unique<char[]>(str.size() + 1);
    std::memcpy(block.get(), str.data(), str.size());
    block[str.size()] = 0;
    return blocks.emplace_back(std::move(block)).get();
}
