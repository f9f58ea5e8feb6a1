// Keepsake Autopilot
// Plays the open mini-game to completion, one frame at a time

#pragma once

#include <keepsake/experience.h>

#include <vector>

namespace keepsake::cli {

class Autopilot {
public:
    // Plan moves for the open mini-game; false if none is open
    bool start(Experience& exp, double now);

    // Perform every move that is due
    void update(Experience& exp, double now);

    bool busy() const { return m_active; }

private:
    struct Move {
        double at = 0.0;
        int target = -1;
        bool press = true;
    };

    enum class Plan {
        Moves,          // m_moves at fixed times
        AwaitSequence   // wait until the pattern has played, then plan moves
    };

    Plan m_plan = Plan::Moves;
    std::vector<Move> m_moves;
    size_t m_next = 0;
    bool m_active = false;
};

} // namespace keepsake::cli
