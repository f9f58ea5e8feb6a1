// Keepsake Commands
// One line of a script or of interactive input

#pragma once

#include <string>

namespace keepsake::cli {

enum class CommandKind {
    Gesture,        // gesture
    Start,          // start
    Tap,            // tap <object>
    Press,          // press <target>
    Release,        // release <target>
    Solve,          // solve            (autopilot finishes the open mini-game)
    CloseGame,      // close
    DismissGame,    // dismiss
    Mute,           // mute
    Volume,         // volume <0..1>
    DiaryOpen,      // diary open
    DiaryClose,     // diary close
    DiaryPrev,      // diary prev
    DiaryNext,      // diary next
    FinaleRequest,  // finale request
    FinaleAccept,   // finale accept
    FinaleDismiss,  // finale dismiss
    FinaleClose,    // finale close
    PlayerToggle,   // player
    Seek,           // seek <0..1>
    Resume,         // resume
    Wait,           // wait <ms>
    Status,         // status
    Quit            // quit
};

struct Command {
    CommandKind kind = CommandKind::Status;
    std::string text;   // object id for Tap
    double value = 0.0; // target, volume, fraction or milliseconds
};

// Parse one line; blank lines and lines starting with '#' yield false with
// an empty error
bool parseCommand(const std::string& line, Command& out, std::string& error);

const char* commandHelp();

} // namespace keepsake::cli
