#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../types.h"
#include "database.h"

namespace hm {

// Machining profile: one moulder setup producing one product shape
struct ProfileRecord {
    i64 id = 0;
    std::string name;
    std::string description;
    f64 feedRate = 30.0; // m/min
    std::optional<i64> materialSizeId;
    std::optional<ByteBuffer> previewImage;
    std::optional<std::string> pdfPath;
    std::string createdAt;
};

// Repository for profile CRUD operations
class ProfileRepository {
  public:
    explicit ProfileRepository(Database& db);

    // Create
    std::optional<i64> insert(const ProfileRecord& profile);

    // Read
    std::optional<ProfileRecord> findById(i64 id);
    std::optional<ProfileRecord> findByName(std::string_view name);
    std::vector<ProfileRecord> findAll();
    std::vector<ProfileRecord> search(std::string_view searchTerm);
    bool exists(i64 id);
    i64 count();

    // Update (all fields except id and createdAt)
    bool update(const ProfileRecord& profile);
    bool updatePdfPath(i64 id, const std::optional<std::string>& pdfPath);

    // Delete (tools, assignments and variants cascade)
    bool remove(i64 id);

  private:
    static ProfileRecord rowToProfile(Statement& stmt);

    Database& m_db;
};

} // namespace hm
