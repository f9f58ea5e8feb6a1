// Keepsake Console Presenter
// Prints every presentation change as a tagged line

#pragma once

#include <keepsake/presenter.h>

#include <iosfwd>

namespace keepsake::cli {

class ConsolePresenter : public Presenter {
public:
    explicit ConsolePresenter(std::ostream& out);

    void showScene(Scene scene) override;
    void setCover(bool on) override;
    void setDarkness(bool on) override;

    void setProgress(size_t discovered, size_t total) override;
    void setObjectDiscovered(const std::string& id) override;
    void showMessage(const std::string& text) override;
    void setFinalButton(bool visible) override;
    void setCompletionPrompt(bool open) override;

    void setMuted(bool muted) override;
    void setVolume(float volume) override;
    void setPlayer(const PlayerReadout& readout) override;

    void showMiniGame(const std::string& title, const std::string& hint) override;
    void setMiniGameHint(const std::string& hint) override;
    void hideMiniGame() override;

    void setDiaryOpen(bool open) override;
    void setDiaryPage(const DiaryPage& page) override;

    void setFinaleText(const std::vector<std::string>& segments) override;
    void revealFinaleSegment(size_t index) override;

private:
    std::ostream& m_out;
    std::vector<std::string> m_finale;
    PlayerReadout m_lastPlayer;
    bool m_playerShown = false;
};

} // namespace keepsake::cli
