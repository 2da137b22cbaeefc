/**
 * @file memory_store.hpp
 * @brief In-memory implementation of the entity and settings stores.
 *
 * Used by the tests and, through toJson()/fromJson(), as the file-backed
 * store of the pairing demo.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "ktnsync/core/interfaces/istore.hpp"

namespace ktnsync {

    /**
     * @class MemoryStore
     * @brief Ordered in-memory collections keyed by entity id.
     *
     * Upserts replace the stored record wholesale.
     */
    class MemoryStore : public IEntityStore, public ISettingsStore {
    public:
        MemoryStore() = default;

        std::vector<Folder>   getAllFolders() override;
        std::vector<Notebook> getAllNotebooks() override;
        std::vector<Note>     getAllNotes() override;

        std::optional<Folder>   getFolder(const std::string& id) override;
        std::optional<Notebook> getNotebook(const std::string& id) override;
        std::optional<Note>     getNote(const std::string& id) override;

        void upsertFolder(const Folder& f) override;
        void upsertNotebook(const Notebook& n) override;
        void upsertNote(const Note& n) override;

        std::optional<nlohmann::json> getSetting(const std::string& key) override;
        void setSetting(const std::string& key, const nlohmann::json& value) override;
        void removeSetting(const std::string& key) override;

        size_t folderCount() const   { return folders_.size(); }
        size_t notebookCount() const { return notebooks_.size(); }
        size_t noteCount() const     { return notes_.size(); }

        /**
         * @brief Whole store as {"folders":[], "notebooks":[], "notes":[], "settings":{}}.
         */
        nlohmann::json toJson() const;

        /**
         * @brief Replace the contents from a document produced by toJson().
         *
         * Malformed records are skipped with a warning.
         */
        void fromJson(const nlohmann::json& doc);

#ifdef KTNSYNC_TEST
        /// Make the next @p n writes throw (entity and settings writes alike).
        void failNextWrites(int n) { failWrites_ = n; }
        /// Make every read and write throw until cleared.
        void setUnavailable(bool v) { unavailable_ = v; }
        /// Make upserts of this entity id throw.
        void failWritesFor(const std::string& id) { poisonedId_ = id; }
#endif

    private:
        void checkRead() const;
        void checkWrite(const std::string& id);

        std::map<std::string, Folder>         folders_;
        std::map<std::string, Notebook>       notebooks_;
        std::map<std::string, Note>           notes_;
        std::map<std::string, nlohmann::json> settings_;

        int         failWrites_{ 0 };
        bool        unavailable_{ false };
        std::string poisonedId_;
    };

}
