#pragma once

#include "forge/builder.hpp"
#include "forge/utility.hpp"

#include <filesystem>
#include <string_view>

namespace forge {

/**
 * @brief Loads a JSON recipe manifest into the builder.
 *
 * The file is memory-mapped and parsed in one pass. Recipes keep the order of the `recipes`
 * array. Any structural problem is reported as MalformedManifest naming the offending field.
 *
 * @param builder The builder to populate with recipes, aliases and settings.
 * @param path The path to the manifest file (typically "forge.json").
 * @return Success or error.
 */
Result<void> parse(CatalogBuilder &builder, const std::filesystem::path &path);

// Same as above for a manifest already in memory.
Result<void> parse_manifest(CatalogBuilder &builder, std::string_view content);

} // namespace forge
