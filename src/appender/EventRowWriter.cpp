#include "logdb/EventRowWriter.hpp"
#include "logdb/ReferenceMask.hpp"
#include "logdb/SqlConstants.hpp"

namespace logdb {

void bindLoggingEvent(Statement& insertStatement, const LoggingEvent& event) {
    insertStatement.bindValue(sql::EVENT_TIMESTAMP, QVariant::fromValue<qint64>(event.timestampMs));
    insertStatement.bindValue(sql::EVENT_FORMATTED_MESSAGE, event.formattedMessage);
    insertStatement.bindValue(sql::EVENT_LOGGER_NAME, event.loggerName);
    insertStatement.bindValue(sql::EVENT_LEVEL, event.level);
    insertStatement.bindValue(sql::EVENT_THREAD_NAME, event.threadName);
    // Bound as int, some drivers have no binding for 16-bit values.
    insertStatement.bindValue(sql::EVENT_REFERENCE_FLAG, static_cast<int>(computeReferenceMask(event)));
}

void bindCallerData(Statement& insertStatement, const QList<CallerFrame>& callerData) {
    if (callerData.isEmpty()) {
        return;
    }
    // Deeper frames are not persisted.
    const CallerFrame& frame = callerData.first();
    insertStatement.bindValue(sql::EVENT_CALLER_FILENAME, frame.fileName);
    insertStatement.bindValue(sql::EVENT_CALLER_CLASS, frame.className);
    insertStatement.bindValue(sql::EVENT_CALLER_METHOD, frame.methodName);
    insertStatement.bindValue(sql::EVENT_CALLER_LINE, QString::number(frame.lineNumber));
}

int writeEventRow(Statement& insertStatement, const LoggingEvent& event) {
    bindLoggingEvent(insertStatement, event);
    bindCallerData(insertStatement, event.callerData);
    return insertStatement.execute();
}

}  // namespace logdb
