#pragma once

#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

namespace logdb {

using PropertyMap = QHash<QString, QString>;

struct CallerFrame {
    QString fileName;
    QString className;
    QString methodName;
    int lineNumber{-1};
};

// Pre-built logging record handed to the appender. Absent property maps and
// a missing throwable are distinct from empty ones.
struct LoggingEvent {
    qint64 timestampMs{0};
    QString formattedMessage;
    QString loggerName;
    QString level;
    QString threadName;
    QList<CallerFrame> callerData;
    std::optional<QStringList> throwableLines;
    std::optional<PropertyMap> contextProperties;
    std::optional<PropertyMap> mdcProperties;
};

}  // namespace logdb
