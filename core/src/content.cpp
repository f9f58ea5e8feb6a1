// Keepsake - Content Catalogue Implementation

#include <keepsake/content.h>
#include <keepsake/catch_game.h>
#include <keepsake/hold_game.h>
#include <keepsake/sequence_game.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

namespace keepsake {

using json = nlohmann::json;

const char* miniGameKindName(MiniGameKind kind) {
    switch (kind) {
        case MiniGameKind::Hold: return "hold";
        case MiniGameKind::Sequence: return "sequence";
        case MiniGameKind::Catch: return "catch";
    }
    return "unknown";
}

std::vector<std::string> Content::objectIds() const {
    std::vector<std::string> ids;
    ids.reserve(objects.size());
    for (const auto& o : objects) {
        ids.push_back(o.id);
    }
    return ids;
}

const ObjectSpec* Content::find(const std::string& id) const {
    for (const auto& o : objects) {
        if (o.id == id) {
            return &o;
        }
    }
    return nullptr;
}

Content defaultContent() {
    Content c;

    c.objects = {
        {"flower", 0.7f},
        {"star", 1.8f},
        {"letter", 2.6f},
        {"light", 3.1f},
        {"butterfly", 4.2f},
        {"moon", 5.3f},
        {"ribbon", 6.2f},
        {"spark", 7.1f},
        {"seal", 8.0f},
    };

    c.phrases = {
        "There are simple moments that become my favourites when they're with you.",
        "Sometimes I think we found each other right when we needed it most.",
        "I like the way time gets tangled up when we're together.",
        "Sometimes remembering you is all I need to feel fine.",
        "I like how the hours lose their order when we're side by side.",
        "Some things only make sense with you, even in silence.",
        "Funny how one small thought of you can keep me company all day.",
        "Not everything has to be special to be important.",
        "Whatever we're doing, it always feels better with you.",
        "If there's something I want to repeat many times, it's this thing we have without forcing it.",
    };

    c.finale = {
        "There is always something that feels different, even on the most ordinary days.",
        "There are nights I don't want to end just because you're there.",
        "Not everything needs explaining; some feelings are understood without words.",
        "There is something about you that gives me strength when I feel I can't go on.",
        "Thank you for being in places where words don't fit, only silence and presence.",
        "In the end, what matters most is feeling that some moments are worth it, and you are one of them.",
    };

    c.repeatNotice = "You already touched this one. No need to repeat it.";
    c.emptyDiary = "Nothing unlocked yet. Touch something in the world.";
    return c;
}

namespace {

bool readStrings(const json& j, const char* key, std::vector<std::string>& out, std::string& error) {
    if (!j.contains(key)) {
        return true;
    }
    const json& arr = j[key];
    if (!arr.is_array()) {
        error = std::string("'") + key + "' must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& v : arr) {
        if (!v.is_string()) {
            error = std::string("'") + key + "' must be an array of strings";
            return false;
        }
        values.push_back(v.get<std::string>());
    }
    out = std::move(values);
    return true;
}

} // namespace

bool loadContent(const std::filesystem::path& path, Content& content, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Cannot open content file: " + path.string();
        return false;
    }

    Content next = content;
    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            error = "Content file must hold a JSON object";
            return false;
        }

        if (j.contains("objects")) {
            const json& arr = j["objects"];
            if (!arr.is_array() || arr.empty()) {
                error = "'objects' must be a non-empty array";
                return false;
            }
            next.objects.clear();
            for (const auto& o : arr) {
                ObjectSpec spec;
                spec.id = o.value("id", "");
                spec.idleSeed = o.value("idleSeed", 0.0f);
                if (spec.id.empty()) {
                    error = "Every object needs an 'id'";
                    return false;
                }
                if (next.find(spec.id)) {
                    error = "Duplicate object id: " + spec.id;
                    return false;
                }
                next.objects.push_back(spec);
            }
        }

        if (!readStrings(j, "phrases", next.phrases, error) ||
            !readStrings(j, "finale", next.finale, error)) {
            return false;
        }
        next.repeatNotice = j.value("repeatNotice", next.repeatNotice);
        next.emptyDiary = j.value("emptyDiary", next.emptyDiary);
    } catch (const json::exception& e) {
        error = std::string("Invalid content JSON: ") + e.what();
        return false;
    }

    content = std::move(next);
    std::cout << "[Content] Loaded " << path.string() << " (" << content.objects.size()
              << " objects, " << content.phrases.size() << " phrases)" << std::endl;
    return true;
}

MiniGameKind miniGameFor(const std::string& objectId) {
    if (objectId == "butterfly" || objectId == "star") {
        return MiniGameKind::Catch;
    }
    if (objectId == "letter" || objectId == "light") {
        return MiniGameKind::Hold;
    }
    return MiniGameKind::Sequence;
}

std::unique_ptr<MiniGame> makeMiniGame(MiniGameKind kind, uint32_t seed) {
    switch (kind) {
        case MiniGameKind::Hold: return std::make_unique<HoldGame>();
        case MiniGameKind::Sequence: return std::make_unique<SequenceGame>(seed);
        case MiniGameKind::Catch: return std::make_unique<CatchGame>(seed);
    }
    return nullptr;
}

} // namespace keepsake
