#include "logdb/ReferenceMask.hpp"

namespace logdb {

namespace {

bool hasEntries(const std::optional<PropertyMap>& properties) {
    return properties.has_value() && !properties->isEmpty();
}

}  // namespace

qint16 computeReferenceMask(const LoggingEvent& event) {
    qint16 mask = 0;
    // Non-empty merged map iff either source is non-empty.
    if (hasEntries(event.contextProperties) || hasEntries(event.mdcProperties)) {
        mask |= PROPERTIES_EXIST;
    }
    if (event.throwableLines.has_value()) {
        mask |= EXCEPTION_EXISTS;
    }
    if (!event.callerData.isEmpty()) {
        mask |= CALLER_DATA_EXISTS;
    }
    return mask;
}

}  // namespace logdb
