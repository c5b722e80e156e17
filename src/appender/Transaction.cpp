#include "logdb/Transaction.hpp"
#include "logdb/Errors.hpp"
#include "logdb/Logging.hpp"

namespace logdb {

ScopedTransaction::ScopedTransaction(Connection& connection)
    : m_connection(connection)
{
    m_connection.beginTransaction();
    m_open = true;
    qCDebug(logdbSql, "Transaction opened");
}

ScopedTransaction::~ScopedTransaction()
{
    if (!m_open) {
        return;
    }
    try {
        m_connection.rollback();
        qCDebug(logdbSql, "Transaction rolled back");
    } catch (const WriteError& e) {
        qCCritical(logdbSql, "%s", e.what());
    }
}

void ScopedTransaction::commit()
{
    m_connection.commit();
    m_open = false;
    qCDebug(logdbSql, "Transaction committed");
}

}  // namespace logdb
