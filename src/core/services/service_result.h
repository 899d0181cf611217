#pragma once

#include <string>

#include "../types.h"

namespace hm {

// Why a service call failed. Expected failures are reported through these
// codes, never thrown.
enum class ServiceError {
    None,
    ReadOnly,      // caller lacks edit permission
    Validation,    // a parameter is out of range or malformed
    NotFound,      // referenced profile/tool/variant does not exist
    DuplicateCode, // generated tool code already used by another tool
    SetOwnership,  // photo edit on a tool that is not first in its set
    ToolInUse,     // tool still bound to a head
    Storage,       // database or filesystem failure
};

inline const char* toString(ServiceError code) {
    switch (code) {
        case ServiceError::None:
            return "None";
        case ServiceError::ReadOnly:
            return "ReadOnly";
        case ServiceError::Validation:
            return "Validation";
        case ServiceError::NotFound:
            return "NotFound";
        case ServiceError::DuplicateCode:
            return "DuplicateCode";
        case ServiceError::SetOwnership:
            return "SetOwnership";
        case ServiceError::ToolInUse:
            return "ToolInUse";
        case ServiceError::Storage:
            return "Storage";
    }
    return "Unknown";
}

// Result of a mutating service call without a payload
struct ServiceResult {
    bool success = false;
    ServiceError errorCode = ServiceError::None;
    std::string error;

    static ServiceResult ok() { return {true, ServiceError::None, ""}; }

    static ServiceResult fail(ServiceError code, const std::string& error) {
        return {false, code, error};
    }
};

// Result of a create call
struct CreateResult {
    bool success = false;
    ServiceError errorCode = ServiceError::None;
    std::string error;
    i64 id = 0;

    static CreateResult ok(i64 id) { return {true, ServiceError::None, "", id}; }

    static CreateResult fail(ServiceError code, const std::string& error) {
        return {false, code, error, 0};
    }
};

} // namespace hm
