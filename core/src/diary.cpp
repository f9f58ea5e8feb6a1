// Keepsake - Diary Implementation

#include <keepsake/diary.h>
#include <algorithm>
#include <utility>

namespace keepsake {

std::string DiaryPage::meta() const {
    if (total == 0) {
        return "Page 0 / 0";
    }
    return "Page " + std::to_string(index + 1) + " / " + std::to_string(total);
}

Diary::Diary()
    : m_emptyText("Nothing unlocked yet. Go back to the map and touch an object.")
{
}

void Diary::setPhrases(std::vector<std::string> phrases) {
    m_phrases = std::move(phrases);
    if (m_index >= m_phrases.size()) {
        m_index = m_phrases.empty() ? 0 : m_phrases.size() - 1;
    }
    if (!m_swapping) {
        m_shownIndex = m_index;
    }
}

void Diary::open() {
    m_open = true;
    m_swapping = false;
    m_shownIndex = m_index;
}

void Diary::close() {
    m_open = false;
}

bool Diary::prev(double now) {
    if (m_phrases.empty() || m_index == 0) {
        return false;
    }
    return move(m_index - 1, now);
}

bool Diary::next(double now) {
    if (m_phrases.empty() || m_index + 1 >= m_phrases.size()) {
        return false;
    }
    return move(m_index + 1, now);
}

bool Diary::move(size_t target, double now) {
    m_index = target;
    m_swapping = true;
    m_swapStart = now;
    return true;
}

bool Diary::update(double now) {
    if (!m_swapping || now - m_swapStart < SWAP_MS) {
        return false;
    }
    m_swapping = false;
    m_shownIndex = m_index;
    return true;
}

DiaryPage Diary::page() const {
    DiaryPage page;
    page.total = m_phrases.size();
    page.swapping = m_swapping;
    if (page.total == 0) {
        page.text = m_emptyText;
        return page;
    }
    size_t shown = std::min(m_shownIndex, page.total - 1);
    page.index = shown;
    page.text = m_phrases[shown];
    page.canPrev = m_index > 0;
    page.canNext = m_index + 1 < page.total;
    return page;
}

} // namespace keepsake
