#include "size_service.h"

#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace hm {

SizeService::SizeService(Database& db) : m_db(db), m_sizes(db), m_profiles(db) {}

ServiceResult SizeService::validateDims(f64 width, f64 thickness) const {
    if (width <= 0.0) {
        return ServiceResult::fail(ServiceError::Validation,
                                   "Width must be positive, got " + str::formatDecimal(width));
    }
    if (thickness < 0.0) {
        return ServiceResult::fail(ServiceError::Validation,
                                   "Thickness must not be negative, got " +
                                       str::formatDecimal(thickness));
    }
    return ServiceResult::ok();
}

CreateResult SizeService::addMaterialSize(const Permissions& perms, f64 width, f64 thickness,
                                          const std::string& name) {
    if (!perms.canEdit) {
        return CreateResult::fail(ServiceError::ReadOnly, kReadOnlyMessage);
    }
    auto dims = validateDims(width, thickness);
    if (!dims.success) {
        return CreateResult::fail(dims.errorCode, dims.error);
    }

    if (auto existing = m_sizes.findMaterialSizeByDims(width, thickness)) {
        return CreateResult::ok(existing->id);
    }

    MaterialSizeRecord size;
    size.width = width;
    size.thickness = thickness;
    size.name = str::trim(name);
    if (size.name.empty()) {
        size.name = str::formatDecimal(width) + " x " + str::formatDecimal(thickness);
    }

    auto id = m_sizes.insertMaterialSize(size);
    if (!id) {
        return CreateResult::fail(ServiceError::Storage,
                                  "Failed to add material size: " + m_db.lastError());
    }
    log::infof("SizeService", "Added material size %s (id %lld)", size.name.c_str(),
               static_cast<long long>(*id));
    return CreateResult::ok(*id);
}

std::vector<MaterialSizeRecord> SizeService::getAllMaterialSizes() {
    return m_sizes.findAllMaterialSizes();
}

std::optional<MaterialSizeRecord> SizeService::getMaterialSize(i64 id) {
    return m_sizes.findMaterialSizeById(id);
}

ServiceResult SizeService::deleteMaterialSize(const Permissions& perms, i64 id) {
    if (!perms.canEdit) {
        return ServiceResult::fail(ServiceError::ReadOnly, kReadOnlyMessage);
    }
    // Profiles and variants referencing the size fall back to NULL
    if (!m_sizes.removeMaterialSize(id)) {
        return ServiceResult::fail(ServiceError::NotFound,
                                   "Material size " + std::to_string(id) + " not found");
    }
    return ServiceResult::ok();
}

CreateResult SizeService::addVariant(const Permissions& perms,
                                     const ProductVariantRecord& variant) {
    if (!perms.canEdit) {
        return CreateResult::fail(ServiceError::ReadOnly, kReadOnlyMessage);
    }
    auto dims = validateDims(variant.width, variant.thickness);
    if (!dims.success) {
        return CreateResult::fail(dims.errorCode, dims.error);
    }
    if (!m_profiles.exists(variant.profileId)) {
        return CreateResult::fail(ServiceError::NotFound,
                                  "Profile " + std::to_string(variant.profileId) + " not found");
    }

    bool firstVariant = m_sizes.findVariantsForProfile(variant.profileId).empty();

    ProductVariantRecord record = variant;
    record.isDefault = false;
    auto id = m_sizes.insertVariant(record);
    if (!id) {
        return CreateResult::fail(ServiceError::Storage,
                                  "Failed to add product size: " + m_db.lastError());
    }

    // The first variant of a profile becomes its default
    if ((variant.isDefault || firstVariant) && !m_sizes.setDefaultVariant(variant.profileId, *id)) {
        return CreateResult::fail(ServiceError::Storage,
                                  "Product size added but could not be made default");
    }
    return CreateResult::ok(*id);
}

ServiceResult SizeService::updateVariant(const Permissions& perms,
                                         const ProductVariantRecord& variant) {
    if (!perms.canEdit) {
        return ServiceResult::fail(ServiceError::ReadOnly, kReadOnlyMessage);
    }
    auto dims = validateDims(variant.width, variant.thickness);
    if (!dims.success) {
        return dims;
    }

    auto existing = m_sizes.findVariantById(variant.id);
    if (!existing) {
        return ServiceResult::fail(ServiceError::NotFound,
                                   "Product size " + std::to_string(variant.id) + " not found");
    }

    ProductVariantRecord record = variant;
    record.profileId = existing->profileId;
    record.isDefault = existing->isDefault;
    if (!m_sizes.updateVariant(record)) {
        return ServiceResult::fail(ServiceError::Storage,
                                   "Failed to update product size: " + m_db.lastError());
    }

    if (variant.isDefault && !existing->isDefault &&
        !m_sizes.setDefaultVariant(existing->profileId, variant.id)) {
        return ServiceResult::fail(ServiceError::Storage, "Failed to change default product size");
    }
    return ServiceResult::ok();
}

ServiceResult SizeService::deleteVariant(const Permissions& perms, i64 variantId) {
    if (!perms.canEdit) {
        return ServiceResult::fail(ServiceError::ReadOnly, kReadOnlyMessage);
    }
    if (!m_sizes.removeVariant(variantId)) {
        return ServiceResult::fail(ServiceError::NotFound,
                                   "Product size " + std::to_string(variantId) + " not found");
    }
    return ServiceResult::ok();
}

ServiceResult SizeService::setDefaultVariant(const Permissions& perms, i64 profileId,
                                             i64 variantId) {
    if (!perms.canEdit) {
        return ServiceResult::fail(ServiceError::ReadOnly, kReadOnlyMessage);
    }
    if (!m_sizes.setDefaultVariant(profileId, variantId)) {
        return ServiceResult::fail(ServiceError::NotFound,
                                   "Product size " + std::to_string(variantId) +
                                       " not found for profile " + std::to_string(profileId));
    }
    return ServiceResult::ok();
}

std::vector<ProductVariantRecord> SizeService::getVariants(i64 profileId) {
    return m_sizes.findVariantsForProfile(profileId);
}

std::optional<ProductVariantRecord> SizeService::getDefaultVariant(i64 profileId) {
    auto variants = m_sizes.findVariantsForProfile(profileId);
    if (variants.empty()) {
        return std::nullopt;
    }
    // Ordered default first
    return variants.front();
}

std::string SizeService::materialSizeDisplay(const ProfileRecord& profile) {
    if (!profile.materialSizeId) {
        return "";
    }
    auto size = m_sizes.findMaterialSizeById(*profile.materialSizeId);
    return size ? formatMaterialSize(*size) : "";
}

std::string SizeService::productSizesDisplay(i64 profileId) {
    std::vector<std::string> parts;
    for (const auto& variant : m_sizes.findVariantsForProfile(profileId)) {
        std::string text = str::formatDecimal(variant.width);
        if (variant.thickness > 0.0) {
            text += " x " + str::formatDecimal(variant.thickness);
        }
        parts.push_back(text);
    }
    return str::join(parts, "; ");
}

std::string SizeService::formatMaterialSize(const MaterialSizeRecord& size) {
    std::string text = str::formatDecimal(size.width);
    if (size.thickness > 0.0) {
        text += " x " + str::formatDecimal(size.thickness);
    }
    if (!size.name.empty() && size.name != text) {
        text += " (" + size.name + ")";
    }
    return text;
}

std::string SizeService::formatVariant(const ProductVariantRecord& variant) {
    return str::formatDecimal(variant.width) + " x " + str::formatDecimal(variant.thickness) +
           " mm (\xC2\xB1" + str::formatDecimal(variant.tolerance) + ")";
}

} // namespace hm
