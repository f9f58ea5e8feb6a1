// Keepsake Console Presenter

#include "console_presenter.h"
#include <cmath>
#include <ostream>

namespace keepsake::cli {

ConsolePresenter::ConsolePresenter(std::ostream& out)
    : m_out(out) {
}

void ConsolePresenter::showScene(Scene scene) {
    m_out << "[UI] scene: " << sceneName(scene) << "\n";
}

void ConsolePresenter::setCover(bool on) {
    m_out << "[UI] cover " << (on ? "on" : "off") << "\n";
}

void ConsolePresenter::setDarkness(bool on) {
    m_out << "[UI] darkness " << (on ? "on" : "off") << "\n";
}

void ConsolePresenter::setProgress(size_t discovered, size_t total) {
    m_out << "[UI] You have found " << discovered << " of " << total << " keepsakes\n";
}

void ConsolePresenter::setObjectDiscovered(const std::string& id) {
    m_out << "[UI] " << id << " glows\n";
}

void ConsolePresenter::showMessage(const std::string& text) {
    m_out << "[UI] \"" << text << "\"\n";
}

void ConsolePresenter::setFinalButton(bool visible) {
    if (visible) {
        m_out << "[UI] final button available\n";
    }
}

void ConsolePresenter::setCompletionPrompt(bool open) {
    m_out << "[UI] completion prompt " << (open ? "open (finale accept | finale dismiss)" : "closed") << "\n";
}

void ConsolePresenter::setMuted(bool muted) {
    m_out << "[UI] sound " << (muted ? "muted" : "on") << "\n";
}

void ConsolePresenter::setVolume(float volume) {
    m_out << "[UI] volume " << std::lround(volume * 100.0f) << "%\n";
}

void ConsolePresenter::setPlayer(const PlayerReadout& readout) {
    // Pushed every frame in the finale; only print what changed
    bool changed = !m_playerShown
        || readout.title != m_lastPlayer.title
        || readout.playing != m_lastPlayer.playing
        || readout.duration != m_lastPlayer.duration;
    m_lastPlayer = readout;
    m_playerShown = true;
    if (!changed) {
        return;
    }
    m_out << "[UI] player: " << readout.title << " - " << readout.artist << " "
          << readout.elapsed << " / " << readout.duration
          << (readout.playing ? " (playing)" : " (paused)") << "\n";
}

void ConsolePresenter::showMiniGame(const std::string& title, const std::string& hint) {
    m_out << "[UI] mini-game: " << title << " - " << hint << "\n";
}

void ConsolePresenter::setMiniGameHint(const std::string& hint) {
    m_out << "[UI] hint: " << hint << "\n";
}

void ConsolePresenter::hideMiniGame() {
    m_out << "[UI] mini-game closed\n";
}

void ConsolePresenter::setDiaryOpen(bool open) {
    m_out << "[UI] diary " << (open ? "open" : "closed") << "\n";
}

void ConsolePresenter::setDiaryPage(const DiaryPage& page) {
    m_out << "[UI] diary " << page.meta() << ": " << page.text << "\n";
}

void ConsolePresenter::setFinaleText(const std::vector<std::string>& segments) {
    m_finale = segments;
}

void ConsolePresenter::revealFinaleSegment(size_t index) {
    if (index < m_finale.size()) {
        m_out << "[UI] ~ " << m_finale[index] << "\n";
    }
}

} // namespace keepsake::cli
