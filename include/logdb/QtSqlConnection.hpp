#pragma once

#include "logdb/SqlConnection.hpp"

#include <QSqlDatabase>

namespace logdb {

// Connection backed by an open QSqlDatabase. The database handle is shared,
// opening and closing it stays with the caller.
class QtSqlConnection : public Connection {
public:
    explicit QtSqlConnection(const QSqlDatabase& database);

    std::unique_ptr<Statement> prepareStatement(const QString& sql) override;
    QVariant querySingleValue(const QString& sql) override;

    DriverCapabilities probeCapabilities() const override;
    QString driverName() const override;

    void beginTransaction() override;
    void commit() override;
    void rollback() override;

    QSqlDatabase database() const { return m_database; }

private:
    QSqlDatabase m_database;
};

}  // namespace logdb
