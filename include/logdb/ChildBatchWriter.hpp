#pragma once

#include "logdb/LoggingEvent.hpp"
#include "logdb/SqlConnection.hpp"

#include <QList>
#include <QVariant>

namespace logdb {

// (event_id, key, value) minus the event id, which the writer supplies.
struct ChildRow {
    QVariant key;
    QString value;
};

/**
 * Inserts rows that reference a parent logging_event row.
 * Rows are queued and submitted as one batch when the connection supports batch
 * updates, otherwise each row is executed as soon as it is bound. An empty row
 * set prepares no statement at all.
 */
class ChildBatchWriter {
public:
    ChildBatchWriter(Connection& connection, bool batchUpdates);

    int write(const QString& insertSql, qint64 eventId, const QList<ChildRow>& rows) const;

    bool batchUpdates() const { return m_batchUpdates; }

private:
    Connection& m_connection;
    bool m_batchUpdates;
};

int insertProperties(const ChildBatchWriter& writer, qint64 eventId, const PropertyMap& properties);

// Line i of the throwable is stored with index i.
int insertThrowable(const ChildBatchWriter& writer, qint64 eventId, const QStringList& lines);

}  // namespace logdb
