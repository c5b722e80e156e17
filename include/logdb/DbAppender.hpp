#pragma once

#include "logdb/AppenderConfig.hpp"
#include "logdb/EventWriter.hpp"
#include "logdb/LoggingEvent.hpp"
#include "logdb/SqlConnection.hpp"
#include "logdb/SqlDialect.hpp"

#include <QObject>
#include <QString>

namespace logdb {

/**
 * Appender boundary around EventWriter.
 *
 * Capabilities and the dialect are resolved once, in the constructor, against the
 * connection it is given. The connection is borrowed and must outlive the appender.
 * append() never throws: failures are logged, counted and signalled so that
 * logging call sites stay fire-and-forget.
 */
class DbAppender : public QObject
{
    Q_OBJECT

public:
    // Throws ConfigurationError when no key resolution strategy is usable.
    explicit DbAppender(Connection& connection,
                        const AppenderConfig& config = AppenderConfig(),
                        QObject* parent = nullptr);

    bool append(const LoggingEvent& event);

    // Single unit of work: prepare, optional transaction, write, commit.
    AppendOutcome appendOrThrow(const LoggingEvent& event);

    const AppenderConfig& config() const { return m_config; }
    const DriverCapabilities& capabilities() const { return m_writer.capabilities(); }
    const SqlDialect& dialect() const { return m_dialect; }

    qint64 appendedCount() const { return m_appendedCount; }
    qint64 failedCount() const { return m_failedCount; }

signals:
    void eventAppended(qint64 eventId);
    void appendFailed(const QString& message);

private:
    static SqlDialect resolveDialect(const AppenderConfig& config, const Connection& connection);
    AppendOutcome writeEvent(const LoggingEvent& event);

    Connection& m_connection;
    const AppenderConfig m_config;
    const SqlDialect m_dialect;
    const EventWriter m_writer;
    qint64 m_appendedCount{0};
    qint64 m_failedCount{0};
};

}  // namespace logdb
