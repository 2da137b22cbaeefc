#include "ktnsync/core/model/entities.hpp"
#include "ktnsync/core/util/error_types.hpp"

namespace ktnsync {

    namespace {
        using nlohmann::json;

        void writeRecord(json& j, const std::string& id, const char* parentKey,
                         const std::optional<std::string>& parent,
                         const std::string& updatedAt, const json& attrs) {
            j = attrs.is_object() ? attrs : json::object();
            j["id"] = id;
            j[parentKey] = parent ? json(*parent) : json(nullptr);
            j["updatedAt"] = updatedAt;
        }

        void readRecord(const json& j, const char* kind, const char* parentKey,
                        std::string& id, std::optional<std::string>& parent,
                        std::string& updatedAt, json& attrs) {
            if (!j.is_object())
                throw SyncError(SyncErr::MergeEntity, std::string(kind) + " record is not an object");
            auto it = j.find("id");
            if (it == j.end() || !it->is_string() || it->get_ref<const std::string&>().empty())
                throw SyncError(SyncErr::MergeEntity, std::string(kind) + " record without a string id");
            id = it->get<std::string>();

            parent.reset();
            auto p = j.find(parentKey);
            if (p != j.end() && p->is_string()) parent = p->get<std::string>();

            auto u = j.find("updatedAt");
            updatedAt = (u != j.end() && u->is_string()) ? u->get<std::string>() : std::string{};

            attrs = j;
            attrs.erase("id");
            attrs.erase(parentKey);
            attrs.erase("updatedAt");
        }
    }

    bool operator==(const Folder& a, const Folder& b) {
        return a.id == b.id && a.parentId == b.parentId && a.updatedAt == b.updatedAt && a.attrs == b.attrs;
    }
    bool operator==(const Notebook& a, const Notebook& b) {
        return a.id == b.id && a.folderId == b.folderId && a.updatedAt == b.updatedAt && a.attrs == b.attrs;
    }
    bool operator==(const Note& a, const Note& b) {
        return a.id == b.id && a.notebookId == b.notebookId && a.updatedAt == b.updatedAt && a.attrs == b.attrs;
    }

    void to_json(json& j, const Folder& f)   { writeRecord(j, f.id, "parentId", f.parentId, f.updatedAt, f.attrs); }
    void to_json(json& j, const Notebook& n) { writeRecord(j, n.id, "folderId", n.folderId, n.updatedAt, n.attrs); }
    void to_json(json& j, const Note& n)     { writeRecord(j, n.id, "notebookId", n.notebookId, n.updatedAt, n.attrs); }

    void from_json(const json& j, Folder& f)   { readRecord(j, "folder", "parentId", f.id, f.parentId, f.updatedAt, f.attrs); }
    void from_json(const json& j, Notebook& n) { readRecord(j, "notebook", "folderId", n.id, n.folderId, n.updatedAt, n.attrs); }
    void from_json(const json& j, Note& n)     { readRecord(j, "note", "notebookId", n.id, n.notebookId, n.updatedAt, n.attrs); }

}
