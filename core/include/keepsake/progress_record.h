#pragma once

/**
 * @file progress_record.h
 * @brief Persisted profile and the storage seam it is written through
 */

#include <map>
#include <string>
#include <vector>

namespace keepsake {

/**
 * @brief Everything needed to resume a profile after a reload
 *
 * Invariants kept by DiscoveryLedger:
 * - unlockedOrder lists discovered ids in unlock order, without duplicates
 * - assignedPhrases holds at most one phrase per id and is never rewritten
 */
struct ProgressRecord {
    std::vector<std::string> discoveredIds;
    bool muted = false;
    float volume = 1.0f;
    std::map<std::string, std::string> assignedPhrases;
    std::vector<std::string> unlockedOrder;
    bool seenFinal = false;
};

/**
 * @brief Where progress records live
 *
 * Implementations never throw: load() falls back to a default record on any
 * failure and save() logs and returns false.
 */
class ProgressStorage {
public:
    virtual ~ProgressStorage() = default;

    virtual ProgressRecord load() = 0;
    virtual bool save(const ProgressRecord& record) = 0;
};

/**
 * @brief Storage that keeps the last saved record in memory
 *
 * Used when no profile file is configured.
 */
class MemoryProgressStorage : public ProgressStorage {
public:
    ProgressRecord load() override { return m_record; }
    bool save(const ProgressRecord& record) override {
        m_record = record;
        ++m_saves;
        return true;
    }

    const ProgressRecord& record() const { return m_record; }
    int saveCount() const { return m_saves; }

private:
    ProgressRecord m_record;
    int m_saves = 0;
};

} // namespace keepsake
