#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hm {

// Event type definitions for subsystem communication
// These are plain data structs (no inheritance required)

struct ProfileCreated {
    int64_t profileId;
    std::string name;
};

struct ProfileUpdated {
    int64_t profileId;
    std::string name;
};

struct ProfileDeleted {
    int64_t profileId;
};

// profileId is 0 when the selection is cleared
struct CurrentProfileChanged {
    int64_t profileId;
};

struct ToolCreated {
    int64_t toolId;
    int64_t profileId;
    std::string code;
};

struct ToolUpdated {
    int64_t toolId;
    int64_t profileId;
    std::string code;
    bool photoChanged;
};

struct ToolDeleted {
    int64_t toolId;
    int64_t profileId;
    std::string code;
};

struct ToolAssigned {
    int64_t profileId;
    int headNumber;
    int64_t toolId;
    bool positionMismatch;
    std::vector<int> otherHeads;
};

struct AssignmentCleared {
    int64_t profileId;
    int headNumber;
};

struct AccessModeChanged {
    bool canEdit;
};

} // namespace hm
