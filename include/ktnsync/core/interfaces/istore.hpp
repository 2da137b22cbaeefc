/**
 * @file istore.hpp
 * @brief Interfaces to the external document and settings stores.
 *
 * The sync engine reads and writes the replicated collections and the device
 * identity only through these interfaces. Implementations may throw; the
 * engine converts throws into MergeEntity / IdentityStore errors.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "ktnsync/core/model/entities.hpp"

namespace ktnsync {

    /**
     * @class IEntityStore
     * @brief Accessors for the Folder, Notebook and Note collections.
     */
    class IEntityStore {
    public:
        virtual ~IEntityStore() = default;

        virtual std::vector<Folder>   getAllFolders() = 0;
        virtual std::vector<Notebook> getAllNotebooks() = 0;
        virtual std::vector<Note>     getAllNotes() = 0;

        virtual std::optional<Folder>   getFolder(const std::string& id) = 0;
        virtual std::optional<Notebook> getNotebook(const std::string& id) = 0;
        virtual std::optional<Note>     getNote(const std::string& id) = 0;

        /**
         * @brief Insert or replace by id. The entity's updatedAt is stored as given.
         */
        virtual void upsertFolder(const Folder& f) = 0;
        virtual void upsertNotebook(const Notebook& n) = 0;
        virtual void upsertNote(const Note& n) = 0;
    };

    /**
     * @class ISettingsStore
     * @brief Key/value settings (JSON values).
     */
    class ISettingsStore {
    public:
        virtual ~ISettingsStore() = default;
        virtual std::optional<nlohmann::json> getSetting(const std::string& key) = 0;
        virtual void setSetting(const std::string& key, const nlohmann::json& value) = 0;
        virtual void removeSetting(const std::string& key) = 0;
    };

}
