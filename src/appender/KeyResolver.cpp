#include "logdb/KeyResolver.hpp"
#include "logdb/Errors.hpp"
#include "logdb/Logging.hpp"

namespace logdb {

const char* strategyName(KeyResolver::Strategy strategy) {
    switch (strategy) {
    case KeyResolver::Strategy::GeneratedKeys:
        return "generated-keys";
    case KeyResolver::Strategy::SelectInsertId:
        return "select-insert-id";
    }
    return "unknown";
}

KeyResolver::KeyResolver(Strategy strategy, const QString& selectInsertIdSql)
    : m_strategy(strategy), m_selectInsertIdSql(selectInsertIdSql) {}

KeyResolver KeyResolver::forCapabilities(const DriverCapabilities& capabilities,
                                         const QString& selectInsertIdSql) {
    if (capabilities.generatedKeys) {
        return KeyResolver(Strategy::GeneratedKeys, selectInsertIdSql);
    }
    if (selectInsertIdSql.isEmpty()) {
        throw ConfigurationError(
            "Driver does not support generated keys and no SQL dialect provides an insert-id query");
    }
    return KeyResolver(Strategy::SelectInsertId, selectInsertIdSql);
}

qint64 KeyResolver::resolve(Statement& insertStatement, Connection& connection) const {
    if (m_strategy == Strategy::SelectInsertId) {
        return selectInsertId(connection);
    }

    const std::optional<qint64> key = insertStatement.generatedKey();
    if (key) {
        return *key;
    }
    if (m_selectInsertIdSql.isEmpty()) {
        throw KeyResolutionError("Driver returned no generated key for the inserted event");
    }
    qCDebug(logdbSql, "No generated key returned, falling back to %s", qPrintable(m_selectInsertIdSql));
    return selectInsertId(connection);
}

qint64 KeyResolver::selectInsertId(Connection& connection) const {
    QVariant id;
    try {
        id = connection.querySingleValue(m_selectInsertIdSql);
    } catch (const WriteError& e) {
        throw KeyResolutionError(QString("Insert-id query failed: %1").arg(QString::fromUtf8(e.what())));
    }
    if (!id.isValid() || id.isNull()) {
        throw KeyResolutionError(QString("No row returned by %1").arg(m_selectInsertIdSql));
    }
    bool ok = false;
    const qint64 eventId = id.toLongLong(&ok);
    if (!ok) {
        throw KeyResolutionError(QString("Non-numeric event id '%1' returned by %2")
                                     .arg(id.toString(), m_selectInsertIdSql));
    }
    return eventId;
}

}  // namespace logdb
