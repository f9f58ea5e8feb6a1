#pragma once

/**
 * @file diary.h
 * @brief Paged history of unlocked phrases
 */

#include <string>
#include <utility>
#include <vector>

namespace keepsake {

/**
 * @brief What the diary shows right now
 */
struct DiaryPage {
    std::string text;
    size_t index = 0;       ///< 0-based page index
    size_t total = 0;       ///< Number of pages (0 when empty)
    bool canPrev = false;
    bool canNext = false;
    bool swapping = false;  ///< Page text is fading out before the change

    /// @brief "Page 2 / 5", or "Page 0 / 0" when empty
    std::string meta() const;
};

/**
 * @brief Diary pages in unlock order
 *
 * prev()/next() move the index immediately but keep presenting the old page
 * during a short swap-out; update() finishes the swap.
 */
class Diary {
public:
    static constexpr double SWAP_MS = 260.0;

    Diary();

    /// @brief Replace the phrase list; the index is clamped to the new size
    void setPhrases(std::vector<std::string> phrases);

    void open();
    void close();
    bool isOpen() const { return m_open; }

    /// @return true if the index changed
    bool prev(double now);
    bool next(double now);

    /// @return true when a swap finished this update
    bool update(double now);

    /// @brief Page currently presented
    DiaryPage page() const;

    size_t index() const { return m_index; }
    size_t size() const { return m_phrases.size(); }

    void setEmptyText(std::string text) { m_emptyText = std::move(text); }

private:
    bool move(size_t target, double now);

    std::vector<std::string> m_phrases;
    size_t m_index = 0;
    size_t m_shownIndex = 0;
    bool m_open = false;
    bool m_swapping = false;
    double m_swapStart = 0.0;
    std::string m_emptyText;
};

} // namespace keepsake
