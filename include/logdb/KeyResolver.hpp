#pragma once

#include "logdb/SqlConnection.hpp"

#include <QString>

namespace logdb {

/**
 * Obtains the id assigned to the parent row.
 * The strategy is fixed at construction from the driver capabilities.
 */
class KeyResolver {
public:
    enum class Strategy {
        GeneratedKeys,
        SelectInsertId
    };

    KeyResolver(Strategy strategy, const QString& selectInsertIdSql);

    // Throws ConfigurationError when generated keys are unavailable and
    // selectInsertIdSql is empty.
    static KeyResolver forCapabilities(const DriverCapabilities& capabilities,
                                       const QString& selectInsertIdSql);

    // Throws KeyResolutionError when no id can be obtained.
    qint64 resolve(Statement& insertStatement, Connection& connection) const;

    Strategy strategy() const { return m_strategy; }
    const QString& selectInsertIdSql() const { return m_selectInsertIdSql; }

private:
    qint64 selectInsertId(Connection& connection) const;

    Strategy m_strategy;
    QString m_selectInsertIdSql;
};

const char* strategyName(KeyResolver::Strategy strategy);

}  // namespace logdb
