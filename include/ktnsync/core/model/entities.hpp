/**
 * @file entities.hpp
 * @brief Replicated entity types: Folder, Notebook and Note.
 *
 * Each entity carries a creator-assigned id, an ISO-8601 updatedAt set by the
 * owning store on every mutation, its parent reference, and the remaining
 * fields as an opaque JSON object. Two entities with the same id are the same
 * logical object on every device.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace ktnsync {

    /**
     * @struct Folder
     * @brief Folder node; folders form a tree through parentId.
     */
    struct Folder {
        std::string                id;        ///< Stable id
        std::optional<std::string> parentId;  ///< Parent folder, empty for a root folder
        std::string                updatedAt; ///< Last modification (ISO-8601)
        nlohmann::json             attrs = nlohmann::json::object(); ///< name, order, createdAt, ...
    };

    /**
     * @struct Notebook
     * @brief Notebook, optionally filed under a Folder.
     */
    struct Notebook {
        std::string                id;
        std::optional<std::string> folderId;
        std::string                updatedAt;
        nlohmann::json             attrs = nlohmann::json::object(); ///< name, order, pageStyle, createdAt, ...
    };

    /**
     * @struct Note
     * @brief Note belonging to a Notebook.
     */
    struct Note {
        std::string                id;
        std::optional<std::string> notebookId;
        std::string                updatedAt;
        nlohmann::json             attrs = nlohmann::json::object(); ///< title, type, content, order, createdAt, ...
    };

    bool operator==(const Folder& a, const Folder& b);
    bool operator==(const Notebook& a, const Notebook& b);
    bool operator==(const Note& a, const Note& b);

    /*
     * JSON form is the flat record: {"id":..., "parentId":..., "updatedAt":..., <attrs>}.
     * from_json throws SyncError(MergeEntity) when "id" is not a string.
     */
    void to_json(nlohmann::json& j, const Folder& f);
    void from_json(const nlohmann::json& j, Folder& f);
    void to_json(nlohmann::json& j, const Notebook& n);
    void from_json(const nlohmann::json& j, Notebook& n);
    void to_json(nlohmann::json& j, const Note& n);
    void from_json(const nlohmann::json& j, Note& n);

}
