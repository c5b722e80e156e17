#include "logdb/DbAppender.hpp"
#include "logdb/Errors.hpp"
#include "logdb/Logging.hpp"
#include "logdb/SqlConstants.hpp"
#include "logdb/Transaction.hpp"

#include <memory>

namespace logdb {

namespace {

EventWriter makeWriter(const AppenderConfig& config, const SqlDialect& dialect, const Connection& connection)
{
    const DriverCapabilities capabilities = config.resolveCapabilities(connection.probeCapabilities());
    KeyResolver resolver = KeyResolver::forCapabilities(capabilities, dialect.selectInsertId());
    qCInfo(logdbConfig, "Using dialect %s with key strategy %s",
           qPrintable(dialect.name()), strategyName(resolver.strategy()));
    return EventWriter(capabilities, resolver, config.integrityPolicy);
}

}  // namespace

DbAppender::DbAppender(Connection& connection, const AppenderConfig& config, QObject* parent)
    : QObject(parent)
    , m_connection(connection)
    , m_config(config)
    , m_dialect(resolveDialect(config, connection))
    , m_writer(makeWriter(m_config, m_dialect, connection))
{
}

SqlDialect DbAppender::resolveDialect(const AppenderConfig& config, const Connection& connection)
{
    if (!config.dialect.isEmpty()) {
        return SqlDialect::fromName(config.dialect);
    }
    const SqlDialect dialect = SqlDialect::fromDriverName(connection.driverName());
    if (dialect.kind() == SqlDialectKind::Unknown) {
        qCDebug(logdbConfig, "No dialect known for driver %s", qPrintable(connection.driverName()));
    }
    return dialect;
}

bool DbAppender::append(const LoggingEvent& event)
{
    try {
        const AppendOutcome outcome = appendOrThrow(event);
        emit eventAppended(outcome.eventId);
        return true;
    } catch (const AppendError& e) {
        ++m_failedCount;
        const QString message = QString("Problem appending event at stage %1: %2")
                                    .arg(QLatin1String(stageName(e.stage())), QString::fromUtf8(e.what()));
        qCCritical(logdbAppender, "%s", qPrintable(message));
        emit appendFailed(message);
        return false;
    }
}

AppendOutcome DbAppender::appendOrThrow(const LoggingEvent& event)
{
    AppendOutcome outcome;
    if (m_config.transactionMode == TransactionMode::PerEvent) {
        ScopedTransaction transaction(m_connection);
        outcome = writeEvent(event);
        try {
            transaction.commit();
        } catch (AppendError& e) {
            e.setStage(outcome.stage);
            throw;
        }
    } else {
        outcome = writeEvent(event);
    }
    ++m_appendedCount;
    return outcome;
}

AppendOutcome DbAppender::writeEvent(const LoggingEvent& event)
{
    std::unique_ptr<Statement> insertStatement = m_connection.prepareStatement(sql::INSERT_EVENT);
    AppendOutcome outcome = m_writer.subAppend(event, m_connection, *insertStatement);
    insertStatement->close();
    return outcome;
}

}  // namespace logdb
