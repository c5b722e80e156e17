#include "logdb/ChildBatchWriter.hpp"
#include "logdb/Logging.hpp"
#include "logdb/SqlConstants.hpp"

namespace logdb {

ChildBatchWriter::ChildBatchWriter(Connection& connection, bool batchUpdates)
    : m_connection(connection), m_batchUpdates(batchUpdates) {}

int ChildBatchWriter::write(const QString& insertSql, qint64 eventId, const QList<ChildRow>& rows) const {
    if (rows.isEmpty()) {
        return 0;
    }

    std::unique_ptr<Statement> statement = m_connection.prepareStatement(insertSql);
    for (const ChildRow& row : rows) {
        statement->bindValue(sql::CHILD_EVENT_ID, QVariant::fromValue<qint64>(eventId));
        statement->bindValue(sql::CHILD_KEY, row.key);
        statement->bindValue(sql::CHILD_VALUE, row.value);
        if (m_batchUpdates) {
            statement->addBatch();
        } else {
            statement->execute();
        }
    }
    if (m_batchUpdates) {
        statement->executeBatch();
    }
    statement->close();
    return static_cast<int>(rows.size());
}

int insertProperties(const ChildBatchWriter& writer, qint64 eventId, const PropertyMap& properties) {
    QList<ChildRow> rows;
    rows.reserve(properties.size());
    for (auto it = properties.constBegin(); it != properties.constEnd(); ++it) {
        rows.append(ChildRow{it.key(), it.value()});
    }
    return writer.write(sql::INSERT_PROPERTY, eventId, rows);
}

int insertThrowable(const ChildBatchWriter& writer, qint64 eventId, const QStringList& lines) {
    QList<ChildRow> rows;
    rows.reserve(lines.size());
    for (int i = 0; i < lines.size(); ++i) {
        rows.append(ChildRow{i, lines.at(i)});
    }
    qCDebug(logdbSql, "Writing %d exception lines for event %lld", static_cast<int>(rows.size()),
            static_cast<long long>(eventId));
    return writer.write(sql::INSERT_EXCEPTION, eventId, rows);
}

}  // namespace logdb
