#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>

namespace netscan::infra {

/**
 * @brief Reads and parses a whole JSON file.
 * @param path File to read.
 * @return The parsed document, or std::nullopt if the file is missing,
 *         unreadable or not valid JSON. Failures are logged.
 */
std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& path);

/**
 * @brief Replaces a JSON file atomically.
 *
 * The document is written to a sibling temporary file which is then renamed
 * over @p path, so readers see either the old or the new content.
 *
 * @param path Destination file; parent directories are created as needed.
 * @param document Document to write.
 * @return True on success. Failures are logged.
 */
bool writeJsonFileAtomic(const std::filesystem::path& path, const nlohmann::json& document);

} // namespace netscan::infra
