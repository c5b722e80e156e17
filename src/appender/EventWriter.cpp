#include "logdb/EventWriter.hpp"
#include "logdb/ChildBatchWriter.hpp"
#include "logdb/EventRowWriter.hpp"
#include "logdb/Logging.hpp"
#include "logdb/PropertyMerger.hpp"

#include <utility>

namespace logdb {

EventWriter::EventWriter(const DriverCapabilities& capabilities,
                         KeyResolver keyResolver,
                         IntegrityPolicy integrityPolicy)
    : m_capabilities(capabilities)
    , m_keyResolver(std::move(keyResolver))
    , m_integrityPolicy(integrityPolicy) {}

AppendOutcome EventWriter::subAppend(const LoggingEvent& event,
                                     Connection& connection,
                                     Statement& insertStatement) const {
    AppendOutcome outcome;
    try {
        // Algorithm: Parent row → Event id → Properties → Exception lines
        outcome.affectedRows = writeEventRow(insertStatement, event);
        outcome.stage = AppendStage::ParentWritten;
        checkUpdateCount(outcome);

        outcome.eventId = m_keyResolver.resolve(insertStatement, connection);
        outcome.stage = AppendStage::KeyResolved;

        const ChildBatchWriter children(connection, m_capabilities.batchUpdates);
        outcome.propertyRows = insertProperties(children, outcome.eventId, mergePropertyMaps(event));
        outcome.stage = AppendStage::PropertiesWritten;

        if (event.throwableLines) {
            outcome.exceptionRows = insertThrowable(children, outcome.eventId, *event.throwableLines);
        }
        outcome.stage = AppendStage::ExceptionsWritten;
    } catch (AppendError& e) {
        e.setStage(outcome.stage);
        qCDebug(logdbAppender, "Append aborted after stage %s: %s", stageName(outcome.stage), e.what());
        throw;
    }

    qCDebug(logdbAppender, "Event %lld written with %d properties and %d exception lines",
            static_cast<long long>(outcome.eventId), outcome.propertyRows, outcome.exceptionRows);
    return outcome;
}

void EventWriter::checkUpdateCount(AppendOutcome& outcome) const {
    if (outcome.affectedRows == 1) {
        return;
    }
    outcome.integrityWarning = true;
    if (m_integrityPolicy == IntegrityPolicy::AbortOnMismatch) {
        throw WriteError(QString("Failed to insert loggingEvent: %1 rows affected").arg(outcome.affectedRows));
    }
    // Key resolution still runs and may pick up an unrelated row.
    qCWarning(logdbAppender, "Failed to insert loggingEvent: %d rows affected", outcome.affectedRows);
}

}  // namespace logdb
