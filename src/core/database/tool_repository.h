#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../tools/tool_code.h"
#include "../types.h"
#include "database.h"

namespace hm {

// Tool mounted (or mountable) on the moulder for one profile
struct ToolRecord {
    i64 id = 0;
    i64 profileId = 0;
    ToolPosition position = ToolPosition::Bottom;
    ToolType toolType = ToolType::Profile;
    int setNumber = 1;
    std::string code;
    int knivesCount = 6;
    std::string templateId;
    std::string status = "ready"; // ready, worn, in_service
    std::string notes;
    std::optional<ByteBuffer> photo;
};

// Outcome of a set-wide photo write
enum class PhotoWriteResult { Updated, NotFound, NotFirstInSet, StorageError };

// Repository for tool CRUD and the set photo rule: all tools of one profile
// sharing a 5-character code prefix carry the photo of the lowest-id member.
class ToolRepository {
  public:
    explicit ToolRepository(Database& db);

    // Plain insert, photo stored as given
    std::optional<i64> insert(const ToolRecord& tool);

    // Insert inside one transaction: the profile must exist, and when the set
    // already has a first member with a photo, that photo replaces tool.photo.
    std::optional<i64> insertWithPhotoInheritance(const ToolRecord& tool);

    // Read
    std::optional<ToolRecord> findById(i64 id);
    std::optional<ToolRecord> findByCode(std::string_view code);
    std::optional<ToolRecord> findByTemplateId(std::string_view templateId);
    std::vector<ToolRecord> findAll();
    std::vector<ToolRecord> findForProfile(i64 profileId);
    std::vector<ToolRecord> findForPosition(i64 profileId, ToolPosition position);
    i64 count();
    i64 countForProfile(i64 profileId);

    // True when another tool (id != excludeId) already uses the code
    bool codeExists(std::string_view code, i64 excludeId = 0);

    // Set queries, ordered by ascending id
    std::vector<ToolRecord> findSetMembers(i64 profileId, std::string_view setPrefix);
    std::optional<ToolRecord> findFirstInSet(i64 profileId, std::string_view setPrefix);
    bool isFirstInSet(i64 toolId);

    // Update every field except the photo
    bool update(const ToolRecord& tool);

    // Update a tool whose code now falls in another set, in one transaction.
    // The tool takes the photo of the destination set's first member; when the
    // tool itself becomes first, its photo is copied to every member instead.
    bool updateAndJoinSet(const ToolRecord& tool);

    // Write the photo of the set's first member and copy it to every member,
    // all in one transaction. Rejected for any other member.
    PhotoWriteResult updatePhotoForSet(i64 toolId, const std::optional<ByteBuffer>& photo);

    // Delete (never touches the photos of the remaining members)
    bool remove(i64 id);

  private:
    // nullopt for a row whose position or type text is not recognized
    static std::optional<ToolRecord> rowToTool(Statement& stmt);

    std::vector<ToolRecord> collect(Statement& stmt);

    Database& m_db;
};

} // namespace hm
