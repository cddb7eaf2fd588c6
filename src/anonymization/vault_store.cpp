/**
 * @file vault_store.cpp
 * @brief Implementation of the vault file lifecycle
 */

#include "inkognito/anonymization/vault_store.hpp"

namespace inkognito::anonymization {

vault_store::vault_store(std::filesystem::path path, std::shared_ptr<di::ILogger> logger)
    : path_{std::move(path)}
    , logger_{di::or_null(std::move(logger))} {}

auto vault_store::open(const std::filesystem::path& path,
                       std::shared_ptr<di::ILogger> logger) -> Result<vault_store> {
    vault_store store(path, std::move(logger));

    auto loaded = load_vault(path, store.logger_);
    if (loaded.is_err()) {
        if (loaded.error().code == error_codes::vault_not_found) {
            store.logger_->debug_fmt("No vault at {}, starting a new one", path.string());
            return store;
        }
        return Result<vault_store>(loaded.error());
    }

    store.record_ = std::move(loaded.value());
    store.has_record_ = true;
    store.state_ = vault_state::loaded;
    return store;
}

auto vault_store::state() const noexcept -> vault_state {
    return state_;
}

auto vault_store::path() const noexcept -> const std::filesystem::path& {
    return path_;
}

auto vault_store::record() const noexcept -> const vault_record& {
    return record_;
}

auto vault_store::seed() const -> std::optional<mapping_table> {
    if (!has_record_) {
        return std::nullopt;
    }
    return record_.to_table();
}

void vault_store::update(batch_result& batch) {
    auto table = record_.to_table();
    auto added = table.merge(batch.mappings);

    if (!has_record_) {
        record_.date_offset = batch.date_offset;
        record_.created_at = current_timestamp();
        has_record_ = true;
    } else if (batch.date_offset != record_.date_offset) {
        logger_->debug_fmt("Keeping vault date offset {} instead of {}", record_.date_offset,
                           batch.date_offset);
        batch.date_offset = record_.date_offset;
    }
    if (record_.created_at.empty()) {
        record_.created_at = current_timestamp();
    }
    record_.version = std::string{vault_version};
    record_.mappings.clear();
    for (const auto& [original, synthetic] : table.entries()) {
        record_.mappings.emplace_back(synthetic, original);
    }
    for (const auto& [type, count] : batch.statistics) {
        record_.statistics[type] += count;
    }
    record_.file_count += batch.succeeded_count();

    state_ = vault_state::dirty;
    logger_->debug_fmt("Vault {} updated with {} new mappings", path_.string(), added);
}

auto vault_store::persist() -> VoidResult {
    auto saved = save_vault(path_, record_, logger_);
    if (saved.is_err()) {
        return saved;
    }
    state_ = vault_state::persisted;
    return ok();
}

}  // namespace inkognito::anonymization
