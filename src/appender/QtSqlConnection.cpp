#include "logdb/QtSqlConnection.hpp"
#include "logdb/Errors.hpp"
#include "logdb/Logging.hpp"

#include <QSqlDriver>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariantList>
#include <QVector>

namespace logdb {

namespace {

int countPlaceholders(const QString& sql)
{
    return static_cast<int>(sql.count(QLatin1Char('?')));
}

/**
 * QSqlQuery keeps bound values between executions, so rows are staged in
 * m_values and only handed to the query when they are executed. Batched rows
 * are collected column-wise, the shape QSqlQuery::execBatch expects.
 */
class QtSqlStatement : public Statement
{
public:
    QtSqlStatement(const QSqlDatabase& database, const QString& sql)
        : m_query(database)
        , m_values(countPlaceholders(sql))
        , m_batchColumns(m_values.size())
    {
        if (!m_query.prepare(sql)) {
            throw WriteError(QString("Failed to prepare statement: %1 Statement: %2")
                                 .arg(m_query.lastError().text(), sql));
        }
        qCDebug(logdbSql, "Prepared statement with %lld parameters: %s",
                static_cast<long long>(m_values.size()), qPrintable(sql.left(50) + "..."));
    }

    ~QtSqlStatement() override
    {
        close();
    }

    void bindValue(int index, const QVariant& value) override
    {
        if (index < 0 || index >= m_values.size()) {
            throw WriteError(QString("Parameter index %1 out of range (%2 parameters)")
                                 .arg(index).arg(m_values.size()));
        }
        m_values[index] = value;
    }

    int execute() override
    {
        ensureOpen();
        for (int i = 0; i < m_values.size(); ++i) {
            m_query.bindValue(i, m_values[i]);
        }
        clearParameters();

        if (!m_query.exec()) {
            throw WriteError(QString("SQL execution failed: %1").arg(m_query.lastError().text()));
        }
        return m_query.numRowsAffected();
    }

    void addBatch() override
    {
        ensureOpen();
        for (int i = 0; i < m_values.size(); ++i) {
            m_batchColumns[i].append(m_values[i]);
        }
        ++m_batchSize;
        clearParameters();
    }

    int executeBatch() override
    {
        ensureOpen();
        if (m_batchSize == 0) {
            return 0;
        }

        for (int i = 0; i < m_batchColumns.size(); ++i) {
            m_query.bindValue(i, m_batchColumns[i]);
        }
        const int submitted = m_batchSize;
        m_batchColumns = QVector<QVariantList>(m_values.size());
        m_batchSize = 0;

        qCDebug(logdbSql, "Executing batch of %d rows", submitted);
        if (!m_query.execBatch()) {
            throw WriteError(QString("Batch execution failed: %1").arg(m_query.lastError().text()));
        }
        return submitted;
    }

    std::optional<qint64> generatedKey() override
    {
        const QVariant id = m_query.lastInsertId();
        if (!id.isValid() || id.isNull()) {
            return std::nullopt;
        }
        bool ok = false;
        const qint64 key = id.toLongLong(&ok);
        if (!ok) {
            return std::nullopt;
        }
        return key;
    }

    void close() override
    {
        if (m_closed) {
            return;
        }
        m_query.finish();
        m_closed = true;
    }

private:
    void ensureOpen() const
    {
        if (m_closed) {
            throw WriteError("Statement already closed");
        }
    }

    void clearParameters()
    {
        for (QVariant& value : m_values) {
            value = QVariant();
        }
    }

    QSqlQuery m_query;
    QVector<QVariant> m_values;
    QVector<QVariantList> m_batchColumns;
    int m_batchSize = 0;
    bool m_closed = false;
};

}  // namespace

QtSqlConnection::QtSqlConnection(const QSqlDatabase& database)
    : m_database(database)
{
}

std::unique_ptr<Statement> QtSqlConnection::prepareStatement(const QString& sql)
{
    return std::make_unique<QtSqlStatement>(m_database, sql);
}

QVariant QtSqlConnection::querySingleValue(const QString& sql)
{
    QSqlQuery query(m_database);
    if (!query.exec(sql)) {
        throw WriteError(QString("Query failed: %1 Statement: %2")
                             .arg(query.lastError().text(), sql));
    }
    if (!query.next()) {
        return QVariant();
    }
    return query.value(0);
}

DriverCapabilities QtSqlConnection::probeCapabilities() const
{
    DriverCapabilities capabilities;
    const QSqlDriver* driver = m_database.driver();
    if (driver == nullptr) {
        qCWarning(logdbSql, "No driver attached to connection %s", qPrintable(m_database.connectionName()));
        return capabilities;
    }
    capabilities.batchUpdates = driver->hasFeature(QSqlDriver::BatchOperations);
    capabilities.generatedKeys = driver->hasFeature(QSqlDriver::LastInsertId);
    return capabilities;
}

QString QtSqlConnection::driverName() const
{
    return m_database.driverName();
}

void QtSqlConnection::beginTransaction()
{
    if (!m_database.transaction()) {
        throw WriteError(QString("Failed to begin transaction: %1").arg(m_database.lastError().text()));
    }
}

void QtSqlConnection::commit()
{
    if (!m_database.commit()) {
        throw WriteError(QString("Failed to commit transaction: %1").arg(m_database.lastError().text()));
    }
}

void QtSqlConnection::rollback()
{
    if (!m_database.rollback()) {
        throw WriteError(QString("Failed to roll back transaction: %1").arg(m_database.lastError().text()));
    }
}

}  // namespace logdb
