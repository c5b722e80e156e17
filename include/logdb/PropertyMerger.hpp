#pragma once

#include "logdb/LoggingEvent.hpp"

#include <optional>

namespace logdb {

// Context-scope entries first, then event-scope entries on top of them.
PropertyMap mergePropertyMaps(const std::optional<PropertyMap>& contextProperties,
                              const std::optional<PropertyMap>& mdcProperties);

inline PropertyMap mergePropertyMaps(const LoggingEvent& event) {
    return mergePropertyMaps(event.contextProperties, event.mdcProperties);
}

}  // namespace logdb
