#pragma once

#include <QString>
#include <QVariant>

#include <memory>
#include <optional>

namespace logdb {

struct DriverCapabilities {
    bool batchUpdates{false};
    bool generatedKeys{false};
};

/**
 * Prepared statement with 0-based positional parameters.
 * Parameters that were not bound before execute() or addBatch() are sent as NULL,
 * and the bound values are cleared after each row is executed or queued.
 * Failures throw WriteError. Destroying a statement closes it.
 */
class Statement {
public:
    virtual ~Statement() = default;

    virtual void bindValue(int index, const QVariant& value) = 0;

    // Executes the currently bound row, returns the affected row count
    // (-1 when the driver cannot tell).
    virtual int execute() = 0;

    virtual void addBatch() = 0;

    // Submits every queued row in one round trip, returns the number of rows sent.
    virtual int executeBatch() = 0;

    // Key generated by the last execute(), if the driver reported one.
    virtual std::optional<qint64> generatedKey() = 0;

    virtual void close() = 0;
};

class Connection {
public:
    virtual ~Connection() = default;

    virtual std::unique_ptr<Statement> prepareStatement(const QString& sql) = 0;

    // First column of the first row, or an invalid QVariant when there is no row.
    virtual QVariant querySingleValue(const QString& sql) = 0;

    virtual DriverCapabilities probeCapabilities() const = 0;
    virtual QString driverName() const = 0;

    virtual void beginTransaction() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

}  // namespace logdb
