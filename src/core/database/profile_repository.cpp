#include "profile_repository.h"

#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace hm {

namespace {

constexpr const char* kProfileColumns =
    "id, name, description, feed_rate, material_size_id, preview_image, pdf_path, created_at";

} // namespace

ProfileRepository::ProfileRepository(Database& db) : m_db(db) {}

std::optional<i64> ProfileRepository::insert(const ProfileRecord& profile) {
    auto stmt = m_db.prepare(R"(
        INSERT INTO profiles (
            name, description, feed_rate, material_size_id, preview_image, pdf_path
        ) VALUES (?, ?, ?, ?, ?, ?)
    )");

    if (!stmt.isValid()) {
        return std::nullopt;
    }

    if (!stmt.bindText(1, profile.name) ||
        !stmt.bindText(2, profile.description) ||
        !stmt.bindDouble(3, profile.feedRate) ||
        !stmt.bindOptionalInt(4, profile.materialSizeId) ||
        !stmt.bindOptionalBlob(5, profile.previewImage) ||
        !stmt.bindOptionalText(6, profile.pdfPath)) {
        log::error("ProfileRepo", "Failed to bind insert parameters");
        return std::nullopt;
    }

    if (!stmt.execute()) {
        log::errorf("ProfileRepo", "Failed to insert profile: %s", m_db.lastError().c_str());
        return std::nullopt;
    }

    return m_db.lastInsertId();
}

std::optional<ProfileRecord> ProfileRepository::findById(i64 id) {
    auto stmt =
        m_db.prepare(std::string("SELECT ") + kProfileColumns + " FROM profiles WHERE id = ?");
    if (!stmt.isValid()) {
        return std::nullopt;
    }

    if (!stmt.bindInt(1, id)) {
        return std::nullopt;
    }

    if (stmt.step()) {
        return rowToProfile(stmt);
    }

    return std::nullopt;
}

std::optional<ProfileRecord> ProfileRepository::findByName(std::string_view name) {
    auto stmt =
        m_db.prepare(std::string("SELECT ") + kProfileColumns + " FROM profiles WHERE name = ?");
    if (!stmt.isValid()) {
        return std::nullopt;
    }

    if (!stmt.bindText(1, std::string(name))) {
        return std::nullopt;
    }

    if (stmt.step()) {
        return rowToProfile(stmt);
    }

    return std::nullopt;
}

std::vector<ProfileRecord> ProfileRepository::findAll() {
    std::vector<ProfileRecord> results;

    auto stmt = m_db.prepare(std::string("SELECT ") + kProfileColumns +
                             " FROM profiles ORDER BY name ASC");
    if (!stmt.isValid()) {
        return results;
    }

    while (stmt.step()) {
        results.push_back(rowToProfile(stmt));
    }

    return results;
}

std::vector<ProfileRecord> ProfileRepository::search(std::string_view searchTerm) {
    std::vector<ProfileRecord> results;

    auto stmt = m_db.prepare(std::string("SELECT ") + kProfileColumns +
                             " FROM profiles WHERE name LIKE ? ESCAPE '\\'"
                             " OR description LIKE ? ESCAPE '\\' ORDER BY name ASC");
    if (!stmt.isValid()) {
        return results;
    }

    std::string pattern = "%" + str::escapeLike(searchTerm) + "%";
    if (!stmt.bindText(1, pattern) || !stmt.bindText(2, pattern)) {
        return results;
    }

    while (stmt.step()) {
        results.push_back(rowToProfile(stmt));
    }

    return results;
}

bool ProfileRepository::exists(i64 id) {
    auto stmt = m_db.prepare("SELECT 1 FROM profiles WHERE id = ?");
    if (!stmt.isValid() || !stmt.bindInt(1, id)) {
        return false;
    }
    return stmt.step();
}

i64 ProfileRepository::count() {
    auto stmt = m_db.prepare("SELECT COUNT(*) FROM profiles");
    if (!stmt.isValid()) {
        return 0;
    }

    if (stmt.step()) {
        return stmt.getInt(0);
    }

    return 0;
}

bool ProfileRepository::update(const ProfileRecord& profile) {
    auto stmt = m_db.prepare(R"(
        UPDATE profiles SET
            name = ?,
            description = ?,
            feed_rate = ?,
            material_size_id = ?,
            preview_image = ?,
            pdf_path = ?
        WHERE id = ?
    )");

    if (!stmt.isValid()) {
        return false;
    }

    if (!stmt.bindText(1, profile.name) ||
        !stmt.bindText(2, profile.description) ||
        !stmt.bindDouble(3, profile.feedRate) ||
        !stmt.bindOptionalInt(4, profile.materialSizeId) ||
        !stmt.bindOptionalBlob(5, profile.previewImage) ||
        !stmt.bindOptionalText(6, profile.pdfPath) ||
        !stmt.bindInt(7, profile.id)) {
        log::error("ProfileRepo", "Failed to bind update parameters");
        return false;
    }

    if (!stmt.execute()) {
        log::errorf("ProfileRepo", "Failed to update profile %lld: %s",
                    static_cast<long long>(profile.id), m_db.lastError().c_str());
        return false;
    }

    return m_db.changesCount() > 0;
}

bool ProfileRepository::updatePdfPath(i64 id, const std::optional<std::string>& pdfPath) {
    auto stmt = m_db.prepare("UPDATE profiles SET pdf_path = ? WHERE id = ?");
    if (!stmt.isValid()) {
        return false;
    }

    if (!stmt.bindOptionalText(1, pdfPath) || !stmt.bindInt(2, id)) {
        return false;
    }

    return stmt.execute() && m_db.changesCount() > 0;
}

bool ProfileRepository::remove(i64 id) {
    auto stmt = m_db.prepare("DELETE FROM profiles WHERE id = ?");
    if (!stmt.isValid()) {
        return false;
    }

    if (!stmt.bindInt(1, id)) {
        return false;
    }

    if (!stmt.execute()) {
        log::errorf("ProfileRepo", "Failed to delete profile %lld: %s",
                    static_cast<long long>(id), m_db.lastError().c_str());
        return false;
    }

    return m_db.changesCount() > 0;
}

ProfileRecord ProfileRepository::rowToProfile(Statement& stmt) {
    ProfileRecord profile;
    profile.id = stmt.getInt(0);
    profile.name = stmt.getText(1);
    profile.description = stmt.getText(2);
    profile.feedRate = stmt.getDouble(3);
    profile.materialSizeId = stmt.getOptionalInt(4);
    profile.previewImage = stmt.getOptionalBlob(5);
    profile.pdfPath = stmt.getOptionalText(6);
    profile.createdAt = stmt.getText(7);
    return profile;
}

} // namespace hm
