#pragma once

/**
 * @file recording_presenter.h
 * @brief Presenter that remembers what it was told
 */

#include <keepsake/presenter.h>

#include <string>
#include <vector>

namespace keepsake::test {

class RecordingPresenter : public Presenter {
public:
    void showScene(Scene s) override { scenes.push_back(s); }
    void setCover(bool on) override { cover = on; ++coverChanges; }
    void setDarkness(bool on) override { darkness = on; }

    void setProgress(size_t d, size_t t) override { discovered = d; total = t; }
    void setObjectDiscovered(const std::string& id) override { glowing.push_back(id); }
    void showMessage(const std::string& text) override { messages.push_back(text); }
    void setFinalButton(bool visible) override { finalButton = visible; }
    void setCompletionPrompt(bool open) override {
        completionPrompt = open;
        if (open) ++completionOpened;
    }

    void setMuted(bool m) override { muted = m; }
    void setVolume(float v) override { volume = v; }
    void setPlayer(const PlayerReadout& r) override { player = r; ++playerUpdates; }

    void showMiniGame(const std::string& title, const std::string& h) override {
        miniGameTitles.push_back(title);
        hint = h;
        miniGameVisible = true;
    }
    void setMiniGameHint(const std::string& h) override { hint = h; }
    void hideMiniGame() override { miniGameVisible = false; ++miniGameHidden; }

    void setDiaryOpen(bool open) override { diaryOpen = open; }
    void setDiaryPage(const DiaryPage& page) override { diaryPage = page; }

    void setFinaleText(const std::vector<std::string>& segments) override { finale = segments; }
    void revealFinaleSegment(size_t index) override { revealed.push_back(index); }

    std::vector<Scene> scenes;
    bool cover = false;
    int coverChanges = 0;
    bool darkness = false;

    size_t discovered = 0;
    size_t total = 0;
    std::vector<std::string> glowing;
    std::vector<std::string> messages;
    bool finalButton = false;
    bool completionPrompt = false;
    int completionOpened = 0;

    bool muted = false;
    float volume = 1.0f;
    PlayerReadout player;
    int playerUpdates = 0;

    std::vector<std::string> miniGameTitles;
    std::string hint;
    bool miniGameVisible = false;
    int miniGameHidden = 0;

    bool diaryOpen = false;
    DiaryPage diaryPage;

    std::vector<std::string> finale;
    std::vector<size_t> revealed;
};

} // namespace keepsake::test
