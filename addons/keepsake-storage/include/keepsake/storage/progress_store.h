#pragma once

#include <keepsake/progress_record.h>
#include <keepsake/storage/storage.h>

#include <filesystem>
#include <string>

namespace keepsake::storage {

/// @brief Key the profile is stored under
inline constexpr const char* PROFILE_KEY = "keepsake_profile_v1";

/**
 * @brief ProgressStorage kept in a JSON storage file.
 *
 * Reading is tolerant field by field: a wrong type or a missing field falls
 * back to that field's default and the rest of the record is kept. Nothing
 * here throws.
 *
 * Stored shape:
 *   {
 *     "keepsake_profile_v1": {
 *       "discoveredIds": ["star", ...],
 *       "muted": false,
 *       "volume": 1.0,
 *       "assignedPhrases": {"star": "..."},
 *       "unlockedOrder": ["star", ...],
 *       "seenFinal": false
 *     }
 *   }
 */
class JsonProgressStore : public ProgressStorage {
public:
    explicit JsonProgressStore(std::filesystem::path path, std::string key = PROFILE_KEY);

    ProgressRecord load() override;
    bool save(const ProgressRecord& record) override;

    /// @brief Record read from any JSON value (defaults for anything unusable)
    static ProgressRecord fromJson(const nlohmann::json& j);
    static nlohmann::json toJson(const ProgressRecord& record);

    const Storage& storage() const { return storage_; }
    const std::string& key() const { return key_; }

private:
    Storage storage_;
    std::string key_;
};

} // namespace keepsake::storage
