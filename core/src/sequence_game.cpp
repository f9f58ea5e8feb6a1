// Keepsake - Sequence Mini-Game Implementation

#include <keepsake/sequence_game.h>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace keepsake {

const std::array<glm::vec2, SequenceGame::POSITION_COUNT> SequenceGame::POSITIONS = {{
    {0.22f, 0.36f},
    {0.52f, 0.26f},
    {0.78f, 0.54f},
    {0.36f, 0.72f},
}};

SequenceGame::SequenceGame(uint32_t seed)
    : m_rng(seed)
{
}

void SequenceGame::mount(const PlaySurface& surface, double now) {
    PlaySurface area = surface.clamped();

    std::vector<int> shuffled(POSITION_COUNT);
    std::iota(shuffled.begin(), shuffled.end(), 0);
    std::shuffle(shuffled.begin(), shuffled.end(), m_rng);
    m_order.assign(shuffled.begin(), shuffled.begin() + STEP_COUNT);

    m_nodes.clear();
    for (int position : m_order) {
        SequenceNode node;
        node.position = position;
        node.point = glm::vec2(POSITIONS[position].x * area.width,
                               POSITIONS[position].y * area.height);
        m_nodes.push_back(node);
    }

    m_progress = 0;
    m_showing = true;
    m_phaseStart = now + LEAD_IN_MS;
    m_readyAt = 0.0;
    m_flashUntil.clear();
    m_hasPressed = false;
    m_mounted = true;

    setHint(hint());
}

void SequenceGame::unmount() {
    m_mounted = false;
    m_flashUntil.clear();
}

void SequenceGame::press(int target, double now) {
    if (!m_mounted || m_showing || now < m_readyAt) {
        return;
    }
    // Already repeated in full
    if (static_cast<size_t>(m_progress) >= m_order.size()) {
        return;
    }

    auto it = std::find_if(m_nodes.begin(), m_nodes.end(),
                           [target](const SequenceNode& n) { return n.position == target; });
    if (it == m_nodes.end()) {
        return;
    }

    if (m_hasPressed && now - m_lastPress < DEBOUNCE_MS) {
        return;
    }
    m_hasPressed = true;
    m_lastPress = now;
    m_flashUntil[target] = now + FLASH_MS;

    if (target == m_order[static_cast<size_t>(m_progress)]) {
        ++m_progress;
        if (m_progress >= static_cast<int>(m_order.size())) {
            complete();
        }
    } else {
        m_progress = 0;
    }
}

void SequenceGame::update(double now) {
    if (!m_mounted) {
        return;
    }

    int litPosition = -1;

    if (m_showing) {
        if (now >= m_phaseStart) {
            const double stepSpan = STEP_ON_MS + STEP_GAP_MS;
            const double elapsed = now - m_phaseStart;
            const int step = static_cast<int>(std::floor(elapsed / stepSpan));

            if (step >= static_cast<int>(m_order.size())) {
                m_showing = false;
                m_readyAt = now + GRACE_MS;
                setHint("Now you. Repeat the pattern.");
            } else if (elapsed - step * stepSpan < STEP_ON_MS) {
                litPosition = m_order[static_cast<size_t>(step)];
            }
        }
    }

    for (auto& node : m_nodes) {
        bool flashing = false;
        auto flash = m_flashUntil.find(node.position);
        if (flash != m_flashUntil.end()) {
            if (now < flash->second) {
                flashing = true;
            } else {
                m_flashUntil.erase(flash);
            }
        }

        node.lit = node.position == litPosition || flashing;
        node.scale = node.lit ? 1.06f : 1.0f;
    }
}

} // namespace keepsake
