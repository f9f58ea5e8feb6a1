#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace keepsake::storage {

/**
 * @brief Persistent key/value document backed by a JSON file.
 *
 * Each key holds an arbitrary JSON value, so several profiles or settings
 * blocks can share one file. Writes go to a temporary file first and are
 * renamed over the original, so a crash never leaves a half-written file.
 *
 * Usage:
 *   Storage store("progress.json");
 *   store.put("keepsake_profile_v1", {{"muted", true}});
 *   store.save();
 *
 *   // Later...
 *   if (const auto* profile = store.find("keepsake_profile_v1")) { ... }
 */
class Storage {
public:
    /**
     * @brief Open a storage file (loaded immediately).
     * @param path JSON file; created on first save if it doesn't exist.
     */
    explicit Storage(std::filesystem::path path);
    ~Storage();

    // Non-copyable
    Storage(const Storage&) = delete;
    Storage& operator=(const Storage&) = delete;
    Storage(Storage&&) noexcept;
    Storage& operator=(Storage&&) noexcept;

    /**
     * @brief Reload data from file.
     * @return false if the file exists but can't be read or parsed; the
     *         document is empty afterwards and error() says why.
     */
    bool load();

    /**
     * @brief Write data to file.
     * @return true if the file was written.
     */
    bool save();

    bool has(const std::string& key) const;

    /// @brief Value stored under key, or nullptr
    const nlohmann::json* find(const std::string& key) const;

    /// @brief Replace the value stored under key
    void put(const std::string& key, nlohmann::json value);

    /**
     * @brief Remove a key.
     * @return true if key existed and was removed.
     */
    bool remove(const std::string& key);

    void clear();

    const std::filesystem::path& path() const { return path_; }

    /// @brief True if the document has unsaved changes
    bool dirty() const { return dirty_; }

    /// @brief Last load/save failure, empty if none
    const std::string& error() const { return error_; }

private:
    nlohmann::json data_ = nlohmann::json::object();
    std::filesystem::path path_;
    std::string error_;
    bool dirty_ = false;
};

} // namespace keepsake::storage
