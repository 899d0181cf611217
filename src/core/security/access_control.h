#pragma once

#include <string>

#include "../config/config.h"

namespace hm {

class EventBus;

// Capability value passed to every mutating service call
struct Permissions {
    bool canEdit = false;

    static Permissions readOnly() { return Permissions{false}; }
    static Permissions fullAccess() { return Permissions{true}; }
};

// Message returned for a mutating call made without edit rights
inline constexpr const char* kReadOnlyMessage =
    "This operation is not available in Read Only mode";

// Holds the session's access mode. The mode is read from and persisted to
// the configuration; changes are announced with AccessModeChanged.
class AccessController {
  public:
    AccessController(Config& config, EventBus& events);

    AccessMode mode() const { return m_config.getAccessMode(); }
    bool isReadOnly() const { return mode() == AccessMode::ReadOnly; }

    Permissions permissions() const { return Permissions{!isReadOnly()}; }

    // Display text ("Read Only" / "Full Access")
    std::string modeText() const;

    // Switch mode, save the configuration and publish the change.
    // Returns false when the configuration could not be saved; the new mode
    // stays in effect for this session.
    bool setMode(AccessMode newMode);
    bool toggle();

  private:
    Config& m_config;
    EventBus& m_events;
};

} // namespace hm
