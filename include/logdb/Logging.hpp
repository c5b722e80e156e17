#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(logdbAppender)
Q_DECLARE_LOGGING_CATEGORY(logdbSql)
Q_DECLARE_LOGGING_CATEGORY(logdbConfig)
