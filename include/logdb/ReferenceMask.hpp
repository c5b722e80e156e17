#pragma once

#include "logdb/LoggingEvent.hpp"

#include <QtGlobal>

namespace logdb {

// Values persisted in logging_event.reference_flag. Existing readers filter
// on the first two bits, so they must never change.
constexpr qint16 PROPERTIES_EXIST = 0x01;
constexpr qint16 EXCEPTION_EXISTS = 0x02;
constexpr qint16 CALLER_DATA_EXISTS = 0x04;

qint16 computeReferenceMask(const LoggingEvent& event);

}  // namespace logdb
