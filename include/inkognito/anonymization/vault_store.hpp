/**
 * @file vault_store.hpp
 * @brief A vault file tracked across load, update and save
 *
 * vault_store lets repeated anonymization runs extend one vault: the
 * stored mappings seed the next batch, the batch result is merged back, and
 * the merged record is persisted atomically.
 */

#pragma once

#include "anonymization_pipeline.hpp"
#include "mapping_table.hpp"
#include "vault.hpp"

#include <inkognito/core/result.hpp>
#include <inkognito/di/ilogger.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace inkognito::anonymization {

/**
 * @brief Lifecycle of a vault file
 *
 * absent -> dirty -> persisted, or loaded -> dirty -> persisted.
 */
enum class vault_state {
    absent,     ///< No file at the path yet
    loaded,     ///< File read and unchanged
    dirty,      ///< In-memory record differs from the file
    persisted   ///< In-memory record written to the file
};

[[nodiscard]] constexpr auto to_string(vault_state state) noexcept -> std::string_view {
    switch (state) {
        case vault_state::absent:
            return "absent";
        case vault_state::loaded:
            return "loaded";
        case vault_state::dirty:
            return "dirty";
        case vault_state::persisted:
            return "persisted";
    }
    return "unknown";
}

/**
 * @brief Owns the record for one vault path
 *
 * Thread Safety: This class is NOT thread-safe, and two stores on the same
 * path are not coordinated.
 */
class vault_store {
public:
    /**
     * @brief Open the vault at a path
     *
     * A missing file yields an absent store. An existing file must parse.
     *
     * @return The store, or vault_format_error for an unreadable file
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path,
                                   std::shared_ptr<di::ILogger> logger = nullptr)
        -> Result<vault_store>;

    [[nodiscard]] auto state() const noexcept -> vault_state;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path&;

    /**
     * @brief Current record (empty for an absent store)
     */
    [[nodiscard]] auto record() const noexcept -> const vault_record&;

    /**
     * @brief Mapping table to seed the next batch with
     * @return nullopt for an absent store
     */
    [[nodiscard]] auto seed() const -> std::optional<mapping_table>;

    /**
     * @brief Merge a batch result into the record
     *
     * New pairs are appended, statistics are added and the file count grows
     * by the number of successful files. An absent store adopts the batch's
     * date offset; a loaded store keeps its own so dates shifted in earlier
     * runs stay consistent, and batch.date_offset is overwritten with it.
     * created_at is set once, when the record is first created.
     */
    void update(batch_result& batch);

    /**
     * @brief Write the record atomically
     * @return Success, or persistence_failure
     */
    [[nodiscard]] auto persist() -> VoidResult;

private:
    vault_store(std::filesystem::path path, std::shared_ptr<di::ILogger> logger);

    std::filesystem::path path_;
    std::shared_ptr<di::ILogger> logger_;
    vault_record record_;
    vault_state state_{vault_state::absent};
    bool has_record_{false};
};

}  // namespace inkognito::anonymization
