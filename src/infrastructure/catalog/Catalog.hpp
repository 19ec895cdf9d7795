#pragma once

#include "core/types/Network.hpp"

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace netscan::infra {

/**
 * @brief The persisted, ordered collection of network records.
 *
 * Loaded once at construction and written back as a whole after every
 * transaction. A missing or corrupt file yields an empty catalog; a failed
 * write is logged and the in-memory state stays authoritative until the next
 * successful write.
 *
 * @note This class is non-copyable. All access is serialized by an internal
 *       mutex; only infra::ReconciliationEngine runs transactions.
 */
class Catalog {
public:
    /**
     * @brief Constructs the catalog and loads it from disk.
     * @param path Path to networks.json.
     */
    explicit Catalog(std::filesystem::path path);

    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;

    /**
     * @brief Returns a snapshot of all networks in catalog order.
     */
    std::vector<core::Network> networks() const;

    /**
     * @brief Returns the number of networks.
     */
    size_t size() const;

    /**
     * @brief Finds a network by record identifier.
     */
    std::optional<core::Network> findById(const std::string& networkId) const;

    /**
     * @brief Finds a network by name.
     */
    std::optional<core::Network> findByName(const std::string& name) const;

    /**
     * @brief Runs a mutation under the catalog lock and persists the result.
     *
     * The whole catalog is written after @p func returns, whether or not it
     * changed anything.
     *
     * @tparam Func Callable taking std::vector<core::Network>&.
     * @param func Mutation to apply.
     * @return Whatever @p func returns.
     */
    template <typename Func>
    auto transaction(Func&& func) {
        std::lock_guard lock(mutex_);
        if constexpr (std::is_void_v<std::invoke_result_t<Func, std::vector<core::Network>&>>) {
            func(networks_);
            persist();
        } else {
            auto result = func(networks_);
            persist();
            return result;
        }
    }

    /**
     * @brief Writes the catalog to disk.
     * @return True if the write succeeded.
     */
    bool save();

    /**
     * @brief Returns the path of the backing file.
     */
    std::filesystem::path path() const { return path_; }

    /**
     * @brief Serializes networks to the on-disk layout.
     */
    static nlohmann::json toJson(const std::vector<core::Network>& networks);

    /**
     * @brief Parses the on-disk layout; malformed records are skipped.
     * @return Parsed networks; empty if @p j is not an array.
     */
    static std::vector<core::Network> fromJson(const nlohmann::json& j);

    /**
     * @brief Collapses records that share a network name into the first one.
     *
     * Devices of later duplicates are merged in: unknown MACs are added, known
     * MACs keep the most recently seen record with empty descriptive fields
     * filled from the other.
     *
     * @return Number of records removed.
     */
    static size_t consolidate(std::vector<core::Network>& networks);

private:
    void load();
    bool persist();

    std::filesystem::path path_;
    std::vector<core::Network> networks_;
    mutable std::mutex mutex_;
};

} // namespace netscan::infra
