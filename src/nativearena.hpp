// SPDX-License-Identifier: MIT
// Memory handed to libheif for the duration of a native call.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include <memory>
#include <string_view>
#include <vector>

/**
 * Deferred-release arena: every allocation stays valid until the arena is
 * destroyed, which must happen only after the native call that uses the
 * pointers returns.
 */
class NativeArena {
public:
    NativeArena() = default;
    NativeArena(NativeArena&&) = default;
    NativeArena& operator=(NativeArena&&) = default;
    NativeArena(const NativeArena&) = delete;
    NativeArena& operator=(const NativeArena&) = delete;

    /**
     * Copy string to the arena.
     * @param str source string
     * @return pointer to null-terminated copy
     */
    const char* copy(std::string_view str);

    /**
     * Get number of allocations held by the arena.
     * @return number of allocations
     */
    size_t size() const { return blocks.size(); }

private:
    std::vector<std::unique_ptr<char[]>> blocks;
};
