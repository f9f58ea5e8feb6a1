// Keepsake - Discovery Ledger Implementation

#include <keepsake/ledger.h>
#include <algorithm>
#include <set>
#include <utility>

namespace keepsake {

DiscoveryLedger::DiscoveryLedger(SessionState& state, std::vector<std::string> phrasePool,
                                 uint32_t seed)
    : m_state(state)
    , m_pool(std::move(phrasePool))
    , m_rng(seed)
{
}

void DiscoveryLedger::restore(const ProgressRecord& record,
                              const std::vector<std::string>& catalogueOrder) {
    auto inCatalogue = [&](const std::string& id) {
        return std::find(catalogueOrder.begin(), catalogueOrder.end(), id) != catalogueOrder.end();
    };

    m_seenFinal = record.seenFinal;

    for (const auto& id : record.discoveredIds) {
        m_state.discovered.insert(id);
    }

    // Phrases of unknown ids would stay reserved forever
    for (const auto& [id, phrase] : record.assignedPhrases) {
        if (!phrase.empty() && inCatalogue(id)) {
            m_phrases.emplace(id, phrase);
        }
    }

    // The order only lists discovered ids, each once
    m_order.clear();
    for (const auto& id : record.unlockedOrder) {
        if (m_state.isDiscovered(id) &&
            std::find(m_order.begin(), m_order.end(), id) == m_order.end()) {
            m_order.push_back(id);
        }
    }
    for (const auto& id : catalogueOrder) {
        if (m_state.isDiscovered(id) &&
            std::find(m_order.begin(), m_order.end(), id) == m_order.end()) {
            m_order.push_back(id);
        }
    }

    for (const auto& id : m_state.discovered) {
        getOrAssignPhrase(id);
    }
}

UnlockResult DiscoveryLedger::unlock(const std::string& id) {
    UnlockResult result;
    if (m_state.isDiscovered(id)) {
        result.phrase = phraseFor(id);
        return result;
    }

    bool wasComplete = m_state.isComplete();

    m_state.discovered.insert(id);
    result.newlyUnlocked = true;
    result.phrase = getOrAssignPhrase(id);
    if (std::find(m_order.begin(), m_order.end(), id) == m_order.end()) {
        m_order.push_back(id);
    }
    result.crossedCompletion = !wasComplete && m_state.isComplete();
    return result;
}

std::string DiscoveryLedger::getOrAssignPhrase(const std::string& id) {
    auto it = m_phrases.find(id);
    if (it != m_phrases.end()) {
        return it->second;
    }
    if (m_pool.empty()) {
        return {};
    }

    std::set<std::string> used;
    for (const auto& entry : m_phrases) {
        used.insert(entry.second);
    }

    std::vector<std::string> available;
    for (const auto& p : m_pool) {
        if (used.count(p) == 0) {
            available.push_back(p);
        }
    }

    const std::vector<std::string>& from = available.empty() ? m_pool : available;
    std::uniform_int_distribution<size_t> pick(0, from.size() - 1);
    std::string chosen = from[pick(m_rng)];

    m_phrases.emplace(id, chosen);
    return chosen;
}

std::string DiscoveryLedger::phraseFor(const std::string& id) const {
    auto it = m_phrases.find(id);
    return it != m_phrases.end() ? it->second : std::string();
}

std::vector<std::string> DiscoveryLedger::history() const {
    std::vector<std::string> out;
    for (const auto& id : m_order) {
        std::string p = phraseFor(id);
        if (!p.empty()) {
            out.push_back(std::move(p));
        }
    }
    return out;
}

void DiscoveryLedger::fill(ProgressRecord& record) const {
    record.discoveredIds.assign(m_state.discovered.begin(), m_state.discovered.end());
    record.assignedPhrases = m_phrases;
    record.unlockedOrder = m_order;
    record.seenFinal = m_seenFinal;
}

} // namespace keepsake
