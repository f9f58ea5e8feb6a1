#include <keepsake/storage/storage.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <system_error>
#include <utility>

namespace keepsake::storage {

using json = nlohmann::json;
namespace fs = std::filesystem;

Storage::Storage(fs::path path)
    : path_(std::move(path)) {
    load();
}

Storage::~Storage() {
    if (dirty_) {
        save();
    }
}

Storage::Storage(Storage&& other) noexcept
    : data_(std::move(other.data_))
    , path_(std::move(other.path_))
    , error_(std::move(other.error_))
    , dirty_(other.dirty_) {
    other.dirty_ = false;
}

Storage& Storage::operator=(Storage&& other) noexcept {
    if (this != &other) {
        if (dirty_) {
            save();
        }
        data_ = std::move(other.data_);
        path_ = std::move(other.path_);
        error_ = std::move(other.error_);
        dirty_ = other.dirty_;
        other.dirty_ = false;
    }
    return *this;
}

bool Storage::load() {
    error_.clear();
    dirty_ = false;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        data_ = json::object();
        return true;  // New file, empty data is valid
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        error_ = "Failed to open: " + path_.string();
        std::cerr << "[keepsake-storage] " << error_ << "\n";
        data_ = json::object();
        return false;
    }

    try {
        json parsed = json::parse(file);
        if (!parsed.is_object()) {
            error_ = "Top level of " + path_.string() + " is not an object";
            std::cerr << "[keepsake-storage] " << error_ << "\n";
            data_ = json::object();
            return false;
        }
        data_ = std::move(parsed);
        std::cout << "[keepsake-storage] Loaded: " << path_.string() << " ("
                  << data_.size() << " keys)\n";
        return true;
    } catch (const json::exception& e) {
        error_ = std::string("Parse error: ") + e.what();
        std::cerr << "[keepsake-storage] Parse error in " << path_.string() << ": " << e.what() << "\n";
        data_ = json::object();
        return false;
    }
}

bool Storage::save() {
    error_.clear();

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
    }

    fs::path tmp = path_;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            error_ = "Failed to write: " + tmp.string();
            std::cerr << "[keepsake-storage] " << error_ << "\n";
            return false;
        }

        try {
            file << std::setw(2) << data_ << std::endl;
        } catch (const std::exception& e) {
            error_ = std::string("Write error: ") + e.what();
            std::cerr << "[keepsake-storage] " << error_ << "\n";
            return false;
        }
        if (!file) {
            error_ = "Write error: " + tmp.string();
            std::cerr << "[keepsake-storage] " << error_ << "\n";
            return false;
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        error_ = "Failed to replace " + path_.string() + ": " + ec.message();
        std::cerr << "[keepsake-storage] " << error_ << "\n";
        fs::remove(tmp, ec);
        return false;
    }

    dirty_ = false;
    return true;
}

bool Storage::has(const std::string& key) const {
    return data_.contains(key);
}

const json* Storage::find(const std::string& key) const {
    auto it = data_.find(key);
    return it != data_.end() ? &*it : nullptr;
}

void Storage::put(const std::string& key, json value) {
    data_[key] = std::move(value);
    dirty_ = true;
}

bool Storage::remove(const std::string& key) {
    if (data_.contains(key)) {
        data_.erase(key);
        dirty_ = true;
        return true;
    }
    return false;
}

void Storage::clear() {
    data_ = json::object();
    dirty_ = true;
}

} // namespace keepsake::storage
