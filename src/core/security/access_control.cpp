#include "access_control.h"

#include "../events/event_bus.h"
#include "../events/event_types.h"
#include "../utils/log.h"

namespace hm {

AccessController::AccessController(Config& config, EventBus& events)
    : m_config(config), m_events(events) {
    log::infof("Security", "Mode initialized as %s", modeText().c_str());
}

std::string AccessController::modeText() const {
    return isReadOnly() ? "Read Only" : "Full Access";
}

bool AccessController::setMode(AccessMode newMode) {
    if (newMode == mode()) {
        return true;
    }

    m_config.setAccessMode(newMode);
    bool saved = m_config.save();
    if (!saved) {
        log::warning("Security", "Mode changed but configuration could not be saved");
    }

    log::infof("Security", "Switched to %s mode", modeText().c_str());
    m_events.publish(AccessModeChanged{!isReadOnly()});
    return saved;
}

bool AccessController::toggle() {
    return setMode(isReadOnly() ? AccessMode::FullAccess : AccessMode::ReadOnly);
}

} // namespace hm
