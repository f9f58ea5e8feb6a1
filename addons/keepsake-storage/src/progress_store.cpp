#include <keepsake/storage/progress_store.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace keepsake::storage {

using json = nlohmann::json;

namespace {

// Ids were plain strings, but older saves may hold numbers
bool idFrom(const json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return !out.empty();
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    return false;
}

std::vector<std::string> idListFrom(const json& j, const char* key) {
    std::vector<std::string> ids;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return ids;
    }
    for (const auto& v : *it) {
        std::string id;
        if (idFrom(v, id) && std::find(ids.begin(), ids.end(), id) == ids.end()) {
            ids.push_back(std::move(id));
        }
    }
    return ids;
}

} // namespace

JsonProgressStore::JsonProgressStore(std::filesystem::path path, std::string key)
    : storage_(std::move(path))
    , key_(std::move(key)) {
}

ProgressRecord JsonProgressStore::fromJson(const json& j) {
    ProgressRecord r;
    if (!j.is_object()) {
        return r;
    }

    r.discoveredIds = idListFrom(j, "discoveredIds");
    r.unlockedOrder = idListFrom(j, "unlockedOrder");

    auto muted = j.find("muted");
    if (muted != j.end() && muted->is_boolean()) {
        r.muted = muted->get<bool>();
    }

    auto volume = j.find("volume");
    if (volume != j.end() && volume->is_number()) {
        double v = volume->get<double>();
        if (std::isfinite(v)) {
            r.volume = static_cast<float>(std::clamp(v, 0.0, 1.0));
        }
    }

    auto phrases = j.find("assignedPhrases");
    if (phrases != j.end() && phrases->is_object()) {
        for (auto it = phrases->begin(); it != phrases->end(); ++it) {
            if (it.value().is_string() && !it.value().get<std::string>().empty()) {
                r.assignedPhrases.emplace(it.key(), it.value().get<std::string>());
            }
        }
    }

    auto seen = j.find("seenFinal");
    if (seen != j.end() && seen->is_boolean()) {
        r.seenFinal = seen->get<bool>();
    }

    return r;
}

json JsonProgressStore::toJson(const ProgressRecord& record) {
    json j;
    j["discoveredIds"] = record.discoveredIds;
    j["muted"] = record.muted;
    j["volume"] = record.volume;
    j["assignedPhrases"] = record.assignedPhrases;
    j["unlockedOrder"] = record.unlockedOrder;
    j["seenFinal"] = record.seenFinal;
    return j;
}

ProgressRecord JsonProgressStore::load() {
    if (!storage_.load()) {
        std::cerr << "[keepsake-storage] Using a fresh profile: " << storage_.error() << "\n";
        return ProgressRecord{};
    }

    const json* profile = storage_.find(key_);
    if (!profile) {
        return ProgressRecord{};
    }
    if (!profile->is_object()) {
        std::cerr << "[keepsake-storage] Profile '" << key_ << "' is not an object, ignoring\n";
        return ProgressRecord{};
    }
    return fromJson(*profile);
}

bool JsonProgressStore::save(const ProgressRecord& record) {
    storage_.put(key_, toJson(record));
    return storage_.save();
}

} // namespace keepsake::storage
