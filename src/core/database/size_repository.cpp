#include "size_repository.h"

#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace hm {

namespace {

constexpr const char* kMaterialSizeColumns = "id, width, thickness, name, description";

constexpr const char* kVariantColumns =
    "id, profile_id, width, thickness, tolerance, material_size_id, is_default, sort_order, notes";

// Replace the separators people type between the two numbers with a single 'x'
std::string normalizeSeparators(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        // U+00D7 MULTIPLICATION SIGN is 0xC3 0x97 in UTF-8
        if (c == 0xC3 && i + 1 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0x97) {
            out += 'x';
            ++i;
        } else if (c == 'X' || c == '*') {
            out += 'x';
        } else if (c == ',') {
            out += '.';
        } else if (c != ' ' && c != '\t') {
            out += static_cast<char>(c);
        }
    }
    return out;
}

} // namespace

std::optional<SizeDims> parseSizeText(std::string_view text) {
    std::string normalized = normalizeSeparators(str::trim(text));
    if (normalized.empty()) {
        return std::nullopt;
    }

    SizeDims dims;
    auto sep = normalized.find('x');
    if (sep == std::string::npos) {
        if (!str::parseDouble(normalized, dims.width) || dims.width <= 0.0) {
            return std::nullopt;
        }
        return dims;
    }

    if (!str::parseDouble(std::string_view(normalized).substr(0, sep), dims.width) ||
        !str::parseDouble(std::string_view(normalized).substr(sep + 1), dims.thickness) ||
        dims.width <= 0.0 || dims.thickness <= 0.0) {
        return std::nullopt;
    }
    return dims;
}

SizeRepository::SizeRepository(Database& db) : m_db(db) {}

// --- Material sizes ---

std::optional<i64> SizeRepository::insertMaterialSize(const MaterialSizeRecord& size) {
    auto stmt = m_db.prepare(
        "INSERT INTO material_sizes (width, thickness, name, description) VALUES (?, ?, ?, ?)");
    if (!stmt.isValid()) {
        return std::nullopt;
    }

    if (!stmt.bindDouble(1, size.width) || !stmt.bindDouble(2, size.thickness) ||
        !stmt.bindText(3, size.name) || !stmt.bindText(4, size.description)) {
        log::error("SizeRepo", "Failed to bind material size parameters");
        return std::nullopt;
    }

    if (!stmt.execute()) {
        log::errorf("SizeRepo", "Failed to insert material size: %s", m_db.lastError().c_str());
        return std::nullopt;
    }

    return m_db.lastInsertId();
}

std::optional<MaterialSizeRecord> SizeRepository::findMaterialSizeById(i64 id) {
    auto stmt = m_db.prepare(std::string("SELECT ") + kMaterialSizeColumns +
                             " FROM material_sizes WHERE id = ?");
    if (!stmt.isValid() || !stmt.bindInt(1, id)) {
        return std::nullopt;
    }

    if (stmt.step()) {
        return rowToMaterialSize(stmt);
    }
    return std::nullopt;
}

std::optional<MaterialSizeRecord> SizeRepository::findMaterialSizeByDims(f64 width,
                                                                         f64 thickness) {
    auto stmt = m_db.prepare(std::string("SELECT ") + kMaterialSizeColumns +
                             " FROM material_sizes WHERE width = ? AND thickness = ?"
                             " ORDER BY id ASC LIMIT 1");
    if (!stmt.isValid() || !stmt.bindDouble(1, width) || !stmt.bindDouble(2, thickness)) {
        return std::nullopt;
    }

    if (stmt.step()) {
        return rowToMaterialSize(stmt);
    }
    return std::nullopt;
}

std::vector<MaterialSizeRecord> SizeRepository::findAllMaterialSizes() {
    std::vector<MaterialSizeRecord> results;

    auto stmt = m_db.prepare(std::string("SELECT ") + kMaterialSizeColumns +
                             " FROM material_sizes ORDER BY width ASC, thickness ASC");
    if (!stmt.isValid()) {
        return results;
    }

    while (stmt.step()) {
        results.push_back(rowToMaterialSize(stmt));
    }
    return results;
}

bool SizeRepository::updateMaterialSize(const MaterialSizeRecord& size) {
    auto stmt = m_db.prepare(R"(
        UPDATE material_sizes SET
            width = ?,
            thickness = ?,
            name = ?,
            description = ?
        WHERE id = ?
    )");
    if (!stmt.isValid()) {
        return false;
    }

    if (!stmt.bindDouble(1, size.width) || !stmt.bindDouble(2, size.thickness) ||
        !stmt.bindText(3, size.name) || !stmt.bindText(4, size.description) ||
        !stmt.bindInt(5, size.id)) {
        log::error("SizeRepo", "Failed to bind material size update");
        return false;
    }

    return stmt.execute() && m_db.changesCount() > 0;
}

bool SizeRepository::removeMaterialSize(i64 id) {
    auto stmt = m_db.prepare("DELETE FROM material_sizes WHERE id = ?");
    if (!stmt.isValid() || !stmt.bindInt(1, id)) {
        return false;
    }
    return stmt.execute() && m_db.changesCount() > 0;
}

// --- Product variants ---

std::optional<i64> SizeRepository::insertVariant(const ProductVariantRecord& variant) {
    auto stmt = m_db.prepare(R"(
        INSERT INTO product_size_variants (
            profile_id, width, thickness, tolerance, material_size_id,
            is_default, sort_order, notes
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )");
    if (!stmt.isValid()) {
        return std::nullopt;
    }

    if (!stmt.bindInt(1, variant.profileId) ||
        !stmt.bindDouble(2, variant.width) ||
        !stmt.bindDouble(3, variant.thickness) ||
        !stmt.bindDouble(4, variant.tolerance) ||
        !stmt.bindOptionalInt(5, variant.materialSizeId) ||
        !stmt.bindInt(6, variant.isDefault ? 1 : 0) ||
        !stmt.bindInt(7, variant.sortOrder) ||
        !stmt.bindText(8, variant.notes)) {
        log::error("SizeRepo", "Failed to bind variant parameters");
        return std::nullopt;
    }

    if (!stmt.execute()) {
        log::errorf("SizeRepo", "Failed to insert variant: %s", m_db.lastError().c_str());
        return std::nullopt;
    }

    return m_db.lastInsertId();
}

std::optional<ProductVariantRecord> SizeRepository::findVariantById(i64 id) {
    auto stmt = m_db.prepare(std::string("SELECT ") + kVariantColumns +
                             " FROM product_size_variants WHERE id = ?");
    if (!stmt.isValid() || !stmt.bindInt(1, id)) {
        return std::nullopt;
    }

    if (stmt.step()) {
        return rowToVariant(stmt);
    }
    return std::nullopt;
}

std::vector<ProductVariantRecord> SizeRepository::findVariantsForProfile(i64 profileId) {
    std::vector<ProductVariantRecord> results;

    auto stmt = m_db.prepare(std::string("SELECT ") + kVariantColumns +
                             " FROM product_size_variants WHERE profile_id = ?"
                             " ORDER BY is_default DESC, sort_order ASC, id ASC");
    if (!stmt.isValid() || !stmt.bindInt(1, profileId)) {
        return results;
    }

    while (stmt.step()) {
        results.push_back(rowToVariant(stmt));
    }
    return results;
}

bool SizeRepository::updateVariant(const ProductVariantRecord& variant) {
    auto stmt = m_db.prepare(R"(
        UPDATE product_size_variants SET
            width = ?,
            thickness = ?,
            tolerance = ?,
            material_size_id = ?,
            is_default = ?,
            sort_order = ?,
            notes = ?
        WHERE id = ?
    )");
    if (!stmt.isValid()) {
        return false;
    }

    if (!stmt.bindDouble(1, variant.width) ||
        !stmt.bindDouble(2, variant.thickness) ||
        !stmt.bindDouble(3, variant.tolerance) ||
        !stmt.bindOptionalInt(4, variant.materialSizeId) ||
        !stmt.bindInt(5, variant.isDefault ? 1 : 0) ||
        !stmt.bindInt(6, variant.sortOrder) ||
        !stmt.bindText(7, variant.notes) ||
        !stmt.bindInt(8, variant.id)) {
        log::error("SizeRepo", "Failed to bind variant update");
        return false;
    }

    return stmt.execute() && m_db.changesCount() > 0;
}

bool SizeRepository::removeVariant(i64 id) {
    auto stmt = m_db.prepare("DELETE FROM product_size_variants WHERE id = ?");
    if (!stmt.isValid() || !stmt.bindInt(1, id)) {
        return false;
    }
    return stmt.execute() && m_db.changesCount() > 0;
}

bool SizeRepository::clearDefaultVariants(i64 profileId) {
    auto stmt =
        m_db.prepare("UPDATE product_size_variants SET is_default = 0 WHERE profile_id = ?");
    if (!stmt.isValid() || !stmt.bindInt(1, profileId)) {
        return false;
    }
    return stmt.execute();
}

bool SizeRepository::setDefaultVariant(i64 profileId, i64 variantId) {
    Transaction txn(m_db);
    if (!txn.isActive()) {
        return false;
    }

    if (!clearDefaultVariants(profileId)) {
        return false;
    }

    auto stmt = m_db.prepare(
        "UPDATE product_size_variants SET is_default = 1 WHERE id = ? AND profile_id = ?");
    if (!stmt.isValid() || !stmt.bindInt(1, variantId) || !stmt.bindInt(2, profileId)) {
        return false;
    }
    if (!stmt.execute() || m_db.changesCount() == 0) {
        log::warningf("SizeRepo", "Variant %lld does not belong to profile %lld",
                      static_cast<long long>(variantId), static_cast<long long>(profileId));
        return false;
    }

    return txn.commit();
}

MaterialSizeRecord SizeRepository::rowToMaterialSize(Statement& stmt) {
    MaterialSizeRecord size;
    size.id = stmt.getInt(0);
    size.width = stmt.getDouble(1);
    size.thickness = stmt.getDouble(2);
    size.name = stmt.getText(3);
    size.description = stmt.getText(4);
    return size;
}

ProductVariantRecord SizeRepository::rowToVariant(Statement& stmt) {
    ProductVariantRecord variant;
    variant.id = stmt.getInt(0);
    variant.profileId = stmt.getInt(1);
    variant.width = stmt.getDouble(2);
    variant.thickness = stmt.getDouble(3);
    variant.tolerance = stmt.getDouble(4);
    variant.materialSizeId = stmt.getOptionalInt(5);
    variant.isDefault = stmt.getInt(6) != 0;
    variant.sortOrder = static_cast<int>(stmt.getInt(7));
    variant.notes = stmt.getText(8);
    return variant;
}

} // namespace hm
