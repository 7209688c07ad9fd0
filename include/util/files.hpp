#pragma once

#include <cstdint>
#include <filesystem>

namespace sdbx::util {

// Removes file or directory tree at path. Returns the number of entries removed.
std::uintmax_t removePath(const std::filesystem::path& path);

// Moves src to dst, falling back to copy + remove when rename() crosses devices.
// dst must not exist.
void movePath(const std::filesystem::path& src, const std::filesystem::path& dst);

bool isSameEntity(const std::filesystem::path& a, const std::filesystem::path& b);

// Joins rel onto root, matching existing components case-insensitively.
// Components that do not exist yet are taken as given.
std::filesystem::path resolveCaseInsensitive(const std::filesystem::path& root, const std::filesystem::path& rel);

}
