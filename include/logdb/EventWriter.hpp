#pragma once

#include "logdb/Errors.hpp"
#include "logdb/KeyResolver.hpp"
#include "logdb/LoggingEvent.hpp"
#include "logdb/SqlConnection.hpp"

namespace logdb {

enum class IntegrityPolicy {
    WarnAndContinue,
    AbortOnMismatch
};

struct AppendOutcome {
    qint64 eventId{0};
    int affectedRows{0};
    bool integrityWarning{false};
    int propertyRows{0};
    int exceptionRows{0};
    AppendStage stage{AppendStage::Idle};
};

/**
 * Writes one event as a parent row plus its property and exception children.
 *
 * The three inserts run as separate statements on the caller's connection.
 * No transaction is opened here; wrap the call in a ScopedTransaction when the
 * rows must commit together.
 */
class EventWriter {
public:
    EventWriter(const DriverCapabilities& capabilities,
                KeyResolver keyResolver,
                IntegrityPolicy integrityPolicy = IntegrityPolicy::WarnAndContinue);

    // insertStatement must be prepared from sql::INSERT_EVENT on connection.
    // Throws WriteError or KeyResolutionError with the stage reached so far.
    AppendOutcome subAppend(const LoggingEvent& event,
                            Connection& connection,
                            Statement& insertStatement) const;

    const DriverCapabilities& capabilities() const { return m_capabilities; }
    const KeyResolver& keyResolver() const { return m_keyResolver; }
    IntegrityPolicy integrityPolicy() const { return m_integrityPolicy; }

private:
    void checkUpdateCount(AppendOutcome& outcome) const;

    const DriverCapabilities m_capabilities;
    const KeyResolver m_keyResolver;
    const IntegrityPolicy m_integrityPolicy;
};

}  // namespace logdb
