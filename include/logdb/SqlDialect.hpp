#pragma once

#include <QString>

namespace logdb {

enum class SqlDialectKind {
    Unknown,
    MySQL,
    PostgreSQL,
    SQLite,
    MsSQL,
    Oracle,
    HSQL,
    H2,
    Sybase
};

/**
 * Vendor idiom used to read back the id of the row just inserted on the
 * current session, for drivers that cannot return generated keys.
 */
class SqlDialect {
public:
    SqlDialect() = default;
    explicit SqlDialect(SqlDialectKind kind) : m_kind(kind) {}

    // Accepts the names used in configuration files; throws ConfigurationError otherwise.
    static SqlDialect fromName(const QString& name);

    // Maps a Qt SQL driver name (QMYSQL, QPSQL, QSQLITE, ...). Unrecognised drivers yield Unknown.
    static SqlDialect fromDriverName(const QString& driverName);

    SqlDialectKind kind() const { return m_kind; }
    QString name() const;

    // Empty when the dialect has no such query.
    QString selectInsertId() const;

private:
    SqlDialectKind m_kind{SqlDialectKind::Unknown};
};

}  // namespace logdb
