#pragma once

#include "logdb/EventWriter.hpp"
#include "logdb/SqlConnection.hpp"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace logdb {

enum class TransactionMode {
    None,
    PerEvent
};

/**
 * Appender settings, normally read from a JSON object:
 *
 *   {
 *     "dialect": "postgresql",
 *     "integrityPolicy": "warn" | "abort",
 *     "transactionMode": "none" | "per-event",
 *     "batchUpdates": true,
 *     "generatedKeys": false
 *   }
 *
 * Every key is optional. batchUpdates and generatedKeys override what the driver reports.
 */
struct AppenderConfig {
    QString dialect;
    IntegrityPolicy integrityPolicy{IntegrityPolicy::WarnAndContinue};
    TransactionMode transactionMode{TransactionMode::PerEvent};
    std::optional<bool> batchUpdates;
    std::optional<bool> generatedKeys;

    // Throws ConfigurationError on malformed values.
    static AppenderConfig fromJson(const QJsonObject& json);
    static AppenderConfig fromJsonFile(const QString& path);

    QJsonObject toJson() const;

    DriverCapabilities resolveCapabilities(const DriverCapabilities& probed) const;
};

}  // namespace logdb
