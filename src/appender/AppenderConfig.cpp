#include "logdb/AppenderConfig.hpp"
#include "logdb/Errors.hpp"
#include "logdb/Logging.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QStringList>

namespace logdb {

namespace {

const QStringList KNOWN_KEYS = {
    "dialect", "integrityPolicy", "transactionMode", "batchUpdates", "generatedKeys"
};

QString requireString(const QJsonObject& json, const QString& key) {
    const QJsonValue value = json.value(key);
    if (!value.isString()) {
        throw ConfigurationError(QString("'%1' must be a string").arg(key));
    }
    return value.toString();
}

std::optional<bool> optionalBool(const QJsonObject& json, const QString& key) {
    if (!json.contains(key) || json.value(key).isNull()) {
        return std::nullopt;
    }
    const QJsonValue value = json.value(key);
    if (!value.isBool()) {
        throw ConfigurationError(QString("'%1' must be a boolean").arg(key));
    }
    return value.toBool();
}

IntegrityPolicy parseIntegrityPolicy(const QString& text) {
    if (text == "warn") {
        return IntegrityPolicy::WarnAndContinue;
    }
    if (text == "abort") {
        return IntegrityPolicy::AbortOnMismatch;
    }
    throw ConfigurationError(QString("Unknown integrityPolicy '%1' (expected warn or abort)").arg(text));
}

TransactionMode parseTransactionMode(const QString& text) {
    if (text == "none") {
        return TransactionMode::None;
    }
    if (text == "per-event") {
        return TransactionMode::PerEvent;
    }
    throw ConfigurationError(QString("Unknown transactionMode '%1' (expected none or per-event)").arg(text));
}

}  // namespace

AppenderConfig AppenderConfig::fromJson(const QJsonObject& json) {
    AppenderConfig config;

    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        if (!KNOWN_KEYS.contains(it.key())) {
            qCDebug(logdbConfig, "Ignoring unknown appender setting: %s", qPrintable(it.key()));
        }
    }

    if (json.contains("dialect")) {
        config.dialect = requireString(json, "dialect").trimmed();
    }
    if (json.contains("integrityPolicy")) {
        config.integrityPolicy = parseIntegrityPolicy(requireString(json, "integrityPolicy"));
    }
    if (json.contains("transactionMode")) {
        config.transactionMode = parseTransactionMode(requireString(json, "transactionMode"));
    }
    config.batchUpdates = optionalBool(json, "batchUpdates");
    config.generatedKeys = optionalBool(json, "generatedKeys");
    return config;
}

AppenderConfig AppenderConfig::fromJsonFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw ConfigurationError(QString("Cannot open appender config %1: %2").arg(path, file.errorString()));
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError) {
        throw ConfigurationError(QString("Parse error in %1 at offset %2: %3")
                                     .arg(path).arg(error.offset).arg(error.errorString()));
    }
    if (!doc.isObject()) {
        throw ConfigurationError(QString("Appender config %1 must be a JSON object").arg(path));
    }

    qCDebug(logdbConfig, "Loaded appender config from %s", qPrintable(path));
    return fromJson(doc.object());
}

QJsonObject AppenderConfig::toJson() const {
    QJsonObject json;
    if (!dialect.isEmpty()) {
        json["dialect"] = dialect;
    }
    json["integrityPolicy"] = integrityPolicy == IntegrityPolicy::AbortOnMismatch ? "abort" : "warn";
    json["transactionMode"] = transactionMode == TransactionMode::PerEvent ? "per-event" : "none";
    if (batchUpdates) {
        json["batchUpdates"] = *batchUpdates;
    }
    if (generatedKeys) {
        json["generatedKeys"] = *generatedKeys;
    }
    return json;
}

DriverCapabilities AppenderConfig::resolveCapabilities(const DriverCapabilities& probed) const {
    DriverCapabilities resolved = probed;
    if (batchUpdates) {
        resolved.batchUpdates = *batchUpdates;
    }
    if (generatedKeys) {
        resolved.generatedKeys = *generatedKeys;
    }
    qCInfo(logdbConfig, "Driver capabilities: batch updates %s, generated keys %s",
           resolved.batchUpdates ? "on" : "off", resolved.generatedKeys ? "on" : "off");
    return resolved;
}

}  // namespace logdb
