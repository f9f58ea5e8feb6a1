#pragma once

/**
 * @file ledger.h
 * @brief Discovered objects, their phrases and the order they were found in
 */

#include <keepsake/progress_record.h>
#include <keepsake/session_state.h>

#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>

namespace keepsake {

struct UnlockResult {
    bool newlyUnlocked = false;     ///< False if the id was already discovered
    std::string phrase;             ///< Phrase assigned to the id
    bool crossedCompletion = false; ///< This unlock completed the profile
};

/**
 * @brief The only writer of SessionState::discovered
 *
 * Phrases are first-touch-wins: an id keeps the phrase it was first given,
 * across reloads. New ids draw from phrases nobody holds yet, and from the
 * whole pool once every phrase is taken.
 */
class DiscoveryLedger {
public:
    DiscoveryLedger(SessionState& state, std::vector<std::string> phrasePool,
                    uint32_t seed = std::random_device{}());

    /**
     * @brief Adopt a loaded record
     * @param catalogueOrder Object ids in catalogue order, for rebuilding a
     *                       missing unlock order
     *
     * Older records may lack phrases or the unlock order; both are filled in.
     */
    void restore(const ProgressRecord& record, const std::vector<std::string>& catalogueOrder);

    /// @brief Mark an id discovered; a no-op for ids already discovered
    UnlockResult unlock(const std::string& id);

    /// @brief Existing phrase for the id, assigning one if it has none
    std::string getOrAssignPhrase(const std::string& id);

    /// @brief Assigned phrase or empty string
    std::string phraseFor(const std::string& id) const;

    /// @brief Phrases in unlock order, for the diary
    std::vector<std::string> history() const;

    const std::vector<std::string>& unlockedOrder() const { return m_order; }
    const std::map<std::string, std::string>& assignedPhrases() const { return m_phrases; }
    const std::vector<std::string>& phrasePool() const { return m_pool; }

    bool seenFinal() const { return m_seenFinal; }
    void markSeenFinal() { m_seenFinal = true; }

    /// @brief Copy the ledger's part of the profile into a record
    void fill(ProgressRecord& record) const;

private:
    SessionState& m_state;
    std::vector<std::string> m_pool;
    std::map<std::string, std::string> m_phrases;
    std::vector<std::string> m_order;
    bool m_seenFinal = false;
    std::mt19937 m_rng;
};

} // namespace keepsake
