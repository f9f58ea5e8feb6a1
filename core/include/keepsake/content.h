#pragma once

/**
 * @file content.h
 * @brief Objects, phrases and finale text that make up one experience
 */

#include <keepsake/minigame.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace keepsake {

struct ObjectSpec {
    std::string id;
    float idleSeed = 0.0f;
};

enum class MiniGameKind {
    Hold,
    Sequence,
    Catch
};

const char* miniGameKindName(MiniGameKind kind);

/**
 * @brief Everything the experience says and shows
 */
struct Content {
    std::vector<ObjectSpec> objects;
    std::vector<std::string> phrases;
    std::vector<std::string> finale;

    std::string repeatNotice;   ///< Shown when tapping an object found before
    std::string emptyDiary;     ///< Diary page while nothing is unlocked

    std::vector<std::string> objectIds() const;
    const ObjectSpec* find(const std::string& id) const;
};

/// @brief Built-in content: nine objects, ten phrases, six finale paragraphs
Content defaultContent();

/**
 * @brief Override lists from a JSON content file
 * @param path File with optional "objects", "phrases" and "finale" arrays
 * @param content Updated in place; lists absent from the file are kept
 * @param error Set on failure
 * @return false if the file is missing or malformed (content unchanged)
 *
 * @par Format
 * @code
 * {
 *   "objects": [{"id": "flower", "idleSeed": 0.7}, ...],
 *   "phrases": ["...", ...],
 *   "finale":  ["...", ...],
 *   "repeatNotice": "...",
 *   "emptyDiary": "..."
 * }
 * @endcode
 */
bool loadContent(const std::filesystem::path& path, Content& content, std::string& error);

/// @brief Variant gating the given object
MiniGameKind miniGameFor(const std::string& objectId);

/// @brief Construct a fresh game of the given kind
std::unique_ptr<MiniGame> makeMiniGame(MiniGameKind kind, uint32_t seed);

} // namespace keepsake
