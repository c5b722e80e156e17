#include "logdb/Errors.hpp"

namespace logdb {

const char* stageName(AppendStage stage) {
    switch (stage) {
    case AppendStage::Idle:
        return "idle";
    case AppendStage::ParentWritten:
        return "parent-written";
    case AppendStage::KeyResolved:
        return "key-resolved";
    case AppendStage::PropertiesWritten:
        return "properties-written";
    case AppendStage::ExceptionsWritten:
        return "exceptions-written";
    }
    return "unknown";
}

AppendError::AppendError(const QString& message)
    : std::runtime_error(message.toStdString()) {}

ConfigurationError::ConfigurationError(const QString& message)
    : std::runtime_error(message.toStdString()) {}

}  // namespace logdb
