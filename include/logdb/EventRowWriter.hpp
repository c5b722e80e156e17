#pragma once

#include "logdb/LoggingEvent.hpp"
#include "logdb/SqlConnection.hpp"

namespace logdb {

// Binds the scalar columns of the parent row. Caller columns are bound from the
// first frame only and left unset when the event carries no caller data.
void bindLoggingEvent(Statement& insertStatement, const LoggingEvent& event);
void bindCallerData(Statement& insertStatement, const QList<CallerFrame>& callerData);

// Binds the event, executes the parent insert and returns the affected row count.
int writeEventRow(Statement& insertStatement, const LoggingEvent& event);

}  // namespace logdb
