#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../types.h"
#include "database.h"

namespace hm {

// Raw board dimensions (mm)
struct MaterialSizeRecord {
    i64 id = 0;
    f64 width = 0.0;
    f64 thickness = 0.0;
    std::string name;
    std::string description;
};

// Finished product dimensions produced by a profile
struct ProductVariantRecord {
    i64 id = 0;
    i64 profileId = 0;
    f64 width = 0.0;
    f64 thickness = 0.0;
    f64 tolerance = 0.5;
    std::optional<i64> materialSizeId;
    bool isDefault = false;
    int sortOrder = 0;
    std::string notes;
};

struct SizeDims {
    f64 width = 0.0;
    f64 thickness = 0.0;
};

// Parse a free-text size such as "100x20", "100 X 20" or "100 × 20".
// A single number is accepted as a width with zero thickness.
std::optional<SizeDims> parseSizeText(std::string_view text);

// Repository for material sizes and product size variants
class SizeRepository {
  public:
    explicit SizeRepository(Database& db);

    // Material sizes
    std::optional<i64> insertMaterialSize(const MaterialSizeRecord& size);
    std::optional<MaterialSizeRecord> findMaterialSizeById(i64 id);
    std::optional<MaterialSizeRecord> findMaterialSizeByDims(f64 width, f64 thickness);
    std::vector<MaterialSizeRecord> findAllMaterialSizes();
    bool updateMaterialSize(const MaterialSizeRecord& size);
    bool removeMaterialSize(i64 id);

    // Product variants
    std::optional<i64> insertVariant(const ProductVariantRecord& variant);
    std::optional<ProductVariantRecord> findVariantById(i64 id);
    std::vector<ProductVariantRecord> findVariantsForProfile(i64 profileId);
    bool updateVariant(const ProductVariantRecord& variant);
    bool removeVariant(i64 id);

    // Makes variantId the only default of its profile (one transaction)
    bool setDefaultVariant(i64 profileId, i64 variantId);
    bool clearDefaultVariants(i64 profileId);

  private:
    static MaterialSizeRecord rowToMaterialSize(Statement& stmt);
    static ProductVariantRecord rowToVariant(Statement& stmt);

    Database& m_db;
};

} // namespace hm
