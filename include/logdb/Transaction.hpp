#pragma once

#include "logdb/SqlConnection.hpp"

namespace logdb {

// Rolls back on destruction unless commit() was called.
class ScopedTransaction {
public:
    explicit ScopedTransaction(Connection& connection);
    ~ScopedTransaction();

    ScopedTransaction(const ScopedTransaction&) = delete;
    ScopedTransaction& operator=(const ScopedTransaction&) = delete;

    void commit();

private:
    Connection& m_connection;
    bool m_open{false};
};

}  // namespace logdb
