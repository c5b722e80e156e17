#include "logdb/SqlDialect.hpp"
#include "logdb/Errors.hpp"

namespace logdb {

namespace {

struct DialectEntry {
    SqlDialectKind kind;
    const char* name;
    const char* selectInsertId;
};

const DialectEntry DIALECTS[] = {
    {SqlDialectKind::Unknown, "unknown", ""},
    {SqlDialectKind::MySQL, "mysql", "SELECT LAST_INSERT_ID()"},
    {SqlDialectKind::PostgreSQL, "postgresql", "SELECT currval('logging_event_id_seq')"},
    {SqlDialectKind::SQLite, "sqlite", "SELECT last_insert_rowid()"},
    {SqlDialectKind::MsSQL, "mssql", "SELECT @@identity id"},
    {SqlDialectKind::Oracle, "oracle", "SELECT logging_event_id_seq.currval FROM dual"},
    {SqlDialectKind::HSQL, "hsql", "CALL IDENTITY()"},
    {SqlDialectKind::H2, "h2", "CALL IDENTITY()"},
    {SqlDialectKind::Sybase, "sybase", "SELECT @@identity"},
};

const DialectEntry& entryFor(SqlDialectKind kind) {
    for (const DialectEntry& entry : DIALECTS) {
        if (entry.kind == kind) {
            return entry;
        }
    }
    return DIALECTS[0];
}

}  // namespace

SqlDialect SqlDialect::fromName(const QString& name) {
    const QString normalized = name.trimmed().toLower();
    if (normalized == "mariadb") {
        return SqlDialect(SqlDialectKind::MySQL);
    }
    if (normalized == "postgres" || normalized == "psql") {
        return SqlDialect(SqlDialectKind::PostgreSQL);
    }
    for (const DialectEntry& entry : DIALECTS) {
        if (normalized == QLatin1String(entry.name)) {
            return SqlDialect(entry.kind);
        }
    }
    throw ConfigurationError(QString("Unknown SQL dialect: %1").arg(name));
}

SqlDialect SqlDialect::fromDriverName(const QString& driverName) {
    const QString driver = driverName.toUpper();
    if (driver == "QMYSQL" || driver == "QMYSQL3" || driver == "QMARIADB") {
        return SqlDialect(SqlDialectKind::MySQL);
    }
    if (driver == "QPSQL" || driver == "QPSQL7") {
        return SqlDialect(SqlDialectKind::PostgreSQL);
    }
    if (driver == "QSQLITE" || driver == "QSQLITE3") {
        return SqlDialect(SqlDialectKind::SQLite);
    }
    if (driver == "QOCI" || driver == "QOCI8") {
        return SqlDialect(SqlDialectKind::Oracle);
    }
    if (driver == "QTDS" || driver == "QTDS7") {
        return SqlDialect(SqlDialectKind::Sybase);
    }
    // QODBC, QIBASE, QDB2 and custom drivers need an explicit dialect.
    return SqlDialect();
}

QString SqlDialect::name() const {
    return QLatin1String(entryFor(m_kind).name);
}

QString SqlDialect::selectInsertId() const {
    return QLatin1String(entryFor(m_kind).selectInsertId);
}

}  // namespace logdb
