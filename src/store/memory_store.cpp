#include "ktnsync/store/memory_store.hpp"
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/logger.hpp"

#include <stdexcept>

namespace ktnsync {

    namespace {
        template <typename Map>
        auto valuesOf(const Map& m) {
            std::vector<typename Map::mapped_type> out;
            out.reserve(m.size());
            for (const auto& [_, v] : m) out.push_back(v);
            return out;
        }

        template <typename Map>
        std::optional<typename Map::mapped_type> lookup(const Map& m, const std::string& id) {
            auto it = m.find(id);
            if (it == m.end()) return std::nullopt;
            return it->second;
        }

        template <typename T>
        void loadCollection(const nlohmann::json& doc, const char* key, std::map<std::string, T>& out) {
            out.clear();
            auto it = doc.find(key);
            if (it == doc.end() || !it->is_array()) return;
            for (const auto& rec : *it) {
                try {
                    T e = rec.get<T>();
                    out[e.id] = std::move(e);
                }
                catch (const std::exception& ex) {
                    LOG_WARN(std::string("MemoryStore: skipping malformed ") + key + " record: " + ex.what());
                }
            }
        }
    }

    void MemoryStore::checkRead() const {
        if (unavailable_) throw std::runtime_error("store unavailable");
    }

    void MemoryStore::checkWrite(const std::string& id) {
        checkRead();
        if (failWrites_ > 0) {
            --failWrites_;
            throw std::runtime_error("write rejected");
        }
        if (!poisonedId_.empty() && id == poisonedId_)
            throw std::runtime_error("write rejected for " + id);
    }

    std::vector<Folder>   MemoryStore::getAllFolders()   { checkRead(); return valuesOf(folders_); }
    std::vector<Notebook> MemoryStore::getAllNotebooks() { checkRead(); return valuesOf(notebooks_); }
    std::vector<Note>     MemoryStore::getAllNotes()     { checkRead(); return valuesOf(notes_); }

    std::optional<Folder>   MemoryStore::getFolder(const std::string& id)   { checkRead(); return lookup(folders_, id); }
    std::optional<Notebook> MemoryStore::getNotebook(const std::string& id) { checkRead(); return lookup(notebooks_, id); }
    std::optional<Note>     MemoryStore::getNote(const std::string& id)     { checkRead(); return lookup(notes_, id); }

    void MemoryStore::upsertFolder(const Folder& f)     { checkWrite(f.id); folders_[f.id] = f; }
    void MemoryStore::upsertNotebook(const Notebook& n) { checkWrite(n.id); notebooks_[n.id] = n; }
    void MemoryStore::upsertNote(const Note& n)         { checkWrite(n.id); notes_[n.id] = n; }

    std::optional<nlohmann::json> MemoryStore::getSetting(const std::string& key) {
        checkRead();
        return lookup(settings_, key);
    }

    void MemoryStore::setSetting(const std::string& key, const nlohmann::json& value) {
        checkWrite(key);
        settings_[key] = value;
    }

    void MemoryStore::removeSetting(const std::string& key) {
        checkWrite(key);
        settings_.erase(key);
    }

    nlohmann::json MemoryStore::toJson() const {
        nlohmann::json settings = nlohmann::json::object();
        for (const auto& [k, v] : settings_) settings[k] = v;
        return {
            {"folders",   valuesOf(folders_)},
            {"notebooks", valuesOf(notebooks_)},
            {"notes",     valuesOf(notes_)},
            {"settings",  settings}
        };
    }

    void MemoryStore::fromJson(const nlohmann::json& doc) {
        if (!doc.is_object())
            throw SyncError(SyncErr::Internal, "store document is not a JSON object");
        loadCollection(doc, "folders", folders_);
        loadCollection(doc, "notebooks", notebooks_);
        loadCollection(doc, "notes", notes_);
        settings_.clear();
        auto it = doc.find("settings");
        if (it != doc.end() && it->is_object()) {
            for (auto s = it->begin(); s != it->end(); ++s) settings_[s.key()] = s.value();
        }
    }

}
