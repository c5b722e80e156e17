#include "logdb/Logging.hpp"

Q_LOGGING_CATEGORY(logdbAppender, "logdb.appender")
Q_LOGGING_CATEGORY(logdbSql, "logdb.sql")
Q_LOGGING_CATEGORY(logdbConfig, "logdb.config")
