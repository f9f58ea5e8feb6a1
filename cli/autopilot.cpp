// Keepsake Autopilot

#include "autopilot.h"
#include <keepsake/catch_game.h>
#include <keepsake/hold_game.h>
#include <keepsake/sequence_game.h>
#include <iostream>

namespace keepsake::cli {

namespace {
constexpr double SEQUENCE_SPACING_MS = 320.0;   // above the tap debounce
constexpr double HOLD_MARGIN_MS = 120.0;
}

bool Autopilot::start(Experience& exp, double now) {
    MiniGame* game = exp.miniGames().active();
    if (!game) {
        std::cerr << "[Autopilot] No mini-game is open" << std::endl;
        return false;
    }

    m_moves.clear();
    m_next = 0;
    m_plan = Plan::Moves;

    if (auto* c = dynamic_cast<CatchGame*>(game)) {
        int planned = 0;
        for (size_t i = 0; i < c->targets().size() && planned < CatchGame::REQUIRED_CATCHES; ++i) {
            if (c->targets()[i].alive) {
                m_moves.push_back({now + planned * 200.0, static_cast<int>(i), true});
                ++planned;
            }
        }
    } else if (dynamic_cast<HoldGame*>(game)) {
        m_moves.push_back({now, -1, true});
        m_moves.push_back({now + HoldGame::REQUIRED_MS + HOLD_MARGIN_MS, -1, false});
    } else if (dynamic_cast<SequenceGame*>(game)) {
        m_plan = Plan::AwaitSequence;
    } else {
        std::cerr << "[Autopilot] Don't know how to play '" << game->title() << "'" << std::endl;
        return false;
    }

    std::cout << "[Autopilot] Playing '" << game->title() << "'" << std::endl;
    m_active = true;
    return true;
}

void Autopilot::update(Experience& exp, double now) {
    if (!m_active) {
        return;
    }

    MiniGame* game = exp.miniGames().active();
    if (!game) {
        m_active = false;
        return;
    }

    if (m_plan == Plan::AwaitSequence) {
        auto* seq = dynamic_cast<SequenceGame*>(game);
        if (!seq) {
            m_active = false;
            return;
        }
        if (!seq->isAcceptingInput(now)) {
            return;
        }
        double at = now;
        for (int position : seq->order()) {
            m_moves.push_back({at, position, true});
            m_moves.push_back({at + 60.0, position, false});
            at += SEQUENCE_SPACING_MS;
        }
        m_plan = Plan::Moves;
    }

    while (m_next < m_moves.size() && m_moves[m_next].at <= now) {
        const Move& m = m_moves[m_next++];
        if (m.press) {
            exp.pressMiniGame(m.target);
        } else {
            exp.releaseMiniGame(m.target);
        }
    }

    if (m_next >= m_moves.size()) {
        m_active = false;
    }
}

} // namespace keepsake::cli
