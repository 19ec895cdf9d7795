#include "infrastructure/storage/JsonFile.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace netscan::infra {

std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::debug("{} does not exist", path.string());
        return std::nullopt;
    }

    try {
        std::ifstream file(path);
        if (!file) {
            spdlog::error("Failed to open {}", path.string());
            return std::nullopt;
        }

        nlohmann::json j;
        file >> j;
        return j;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

bool writeJsonFileAtomic(const std::filesystem::path& path, const nlohmann::json& document) {
    auto tempPath = path;
    tempPath += ".tmp";

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        {
            std::ofstream file(tempPath, std::ios::trunc);
            if (!file) {
                spdlog::error("Failed to open {} for writing", tempPath.string());
                return false;
            }

            file << document.dump(2);
            file.flush();
            if (!file) {
                spdlog::error("Failed to write {}", tempPath.string());
                return false;
            }
        }

        std::filesystem::rename(tempPath, path);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save {}: {}", path.string(), e.what());
        std::error_code ec;
        std::filesystem::remove(tempPath, ec);
        return false;
    }
}

} // namespace netscan::infra
