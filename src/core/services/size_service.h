#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../database/profile_repository.h"
#include "../database/size_repository.h"
#include "../security/access_control.h"
#include "service_result.h"

namespace hm {

// Material sizes (raw stock) and product size variants of profiles
class SizeService {
  public:
    explicit SizeService(Database& db);

    // Material sizes

    // Returns the id of an existing size with the same dimensions, or inserts
    // a new one named "{w} x {t}" when no name is given.
    CreateResult addMaterialSize(const Permissions& perms, f64 width, f64 thickness,
                                 const std::string& name = "");
    std::vector<MaterialSizeRecord> getAllMaterialSizes();
    std::optional<MaterialSizeRecord> getMaterialSize(i64 id);
    ServiceResult deleteMaterialSize(const Permissions& perms, i64 id);

    // Product variants

    CreateResult addVariant(const Permissions& perms, const ProductVariantRecord& variant);
    ServiceResult updateVariant(const Permissions& perms, const ProductVariantRecord& variant);
    ServiceResult deleteVariant(const Permissions& perms, i64 variantId);
    ServiceResult setDefaultVariant(const Permissions& perms, i64 profileId, i64 variantId);

    // Default first, then by sort order
    std::vector<ProductVariantRecord> getVariants(i64 profileId);

    // The default variant, or the first one when none is marked
    std::optional<ProductVariantRecord> getDefaultVariant(i64 profileId);

    // Display text of a profile's sizes, "" when unset
    std::string materialSizeDisplay(const ProfileRecord& profile);
    std::string productSizesDisplay(i64 profileId);

    // "100 x 20 (Pine)", "100 (Pine)", "100 x 20"
    static std::string formatMaterialSize(const MaterialSizeRecord& size);

    // "90 x 18 mm (±0.5)"
    static std::string formatVariant(const ProductVariantRecord& variant);

  private:
    ServiceResult validateDims(f64 width, f64 thickness) const;

    Database& m_db;
    SizeRepository m_sizes;
    ProfileRepository m_profiles;
};

} // namespace hm
