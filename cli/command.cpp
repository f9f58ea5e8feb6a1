// Keepsake Commands

#include "command.h"
#include <sstream>
#include <stdexcept>

namespace keepsake::cli {

namespace {

bool readNumber(std::istringstream& in, double& out) {
    std::string token;
    if (!(in >> token)) {
        return false;
    }
    try {
        size_t used = 0;
        out = std::stod(token, &used);
        return used == token.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

bool parseCommand(const std::string& line, Command& out, std::string& error) {
    error.clear();

    std::istringstream in(line);
    std::string verb;
    if (!(in >> verb) || verb[0] == '#') {
        return false;
    }

    out = Command{};

    if (verb == "gesture") { out.kind = CommandKind::Gesture; return true; }
    if (verb == "start") { out.kind = CommandKind::Start; return true; }
    if (verb == "solve") { out.kind = CommandKind::Solve; return true; }
    if (verb == "close") { out.kind = CommandKind::CloseGame; return true; }
    if (verb == "dismiss") { out.kind = CommandKind::DismissGame; return true; }
    if (verb == "mute") { out.kind = CommandKind::Mute; return true; }
    if (verb == "player") { out.kind = CommandKind::PlayerToggle; return true; }
    if (verb == "resume") { out.kind = CommandKind::Resume; return true; }
    if (verb == "status") { out.kind = CommandKind::Status; return true; }
    if (verb == "quit" || verb == "exit") { out.kind = CommandKind::Quit; return true; }

    if (verb == "tap") {
        out.kind = CommandKind::Tap;
        if (!(in >> out.text)) {
            error = "tap needs an object id";
            return false;
        }
        return true;
    }

    if (verb == "press" || verb == "release") {
        out.kind = verb == "press" ? CommandKind::Press : CommandKind::Release;
        out.value = -1.0;
        double target = 0.0;
        if (readNumber(in, target)) {
            out.value = target;
        }
        return true;
    }

    if (verb == "volume" || verb == "seek" || verb == "wait") {
        out.kind = verb == "volume" ? CommandKind::Volume
                 : verb == "seek" ? CommandKind::Seek
                 : CommandKind::Wait;
        if (!readNumber(in, out.value)) {
            error = verb + " needs a number";
            return false;
        }
        return true;
    }

    if (verb == "diary" || verb == "finale") {
        std::string sub;
        in >> sub;
        if (verb == "diary") {
            if (sub == "open") out.kind = CommandKind::DiaryOpen;
            else if (sub == "close") out.kind = CommandKind::DiaryClose;
            else if (sub == "prev") out.kind = CommandKind::DiaryPrev;
            else if (sub == "next") out.kind = CommandKind::DiaryNext;
            else { error = "diary open|close|prev|next"; return false; }
        } else {
            if (sub == "request") out.kind = CommandKind::FinaleRequest;
            else if (sub == "accept") out.kind = CommandKind::FinaleAccept;
            else if (sub == "dismiss") out.kind = CommandKind::FinaleDismiss;
            else if (sub == "close") out.kind = CommandKind::FinaleClose;
            else { error = "finale request|accept|dismiss|close"; return false; }
        }
        return true;
    }

    error = "Unknown command: " + verb;
    return false;
}

const char* commandHelp() {
    return
        "Commands:\n"
        "  start                     Start the journey (intro button)\n"
        "  gesture                   Pointer down anywhere\n"
        "  tap <object>              Tap an object in the world\n"
        "  press [target]            Press in the open mini-game\n"
        "  release [target]          Release in the open mini-game\n"
        "  solve                     Let the autopilot finish the open mini-game\n"
        "  close | dismiss           Close button / backdrop of the mini-game\n"
        "  mute                      Toggle mute\n"
        "  volume <0..1>             Master volume\n"
        "  diary open|close|prev|next\n"
        "  finale request|accept|dismiss|close\n"
        "  player                    Play/pause the current track\n"
        "  seek <0..1>               Seek the current track\n"
        "  resume                    Host regained focus\n"
        "  wait <ms>                 Pause the script\n"
        "  status                    Print progress\n"
        "  quit\n";
}

} // namespace keepsake::cli
