#pragma once

#include <QString>

#include <stdexcept>

namespace logdb {

// Progress of a single append. An aborted append is reported by throwing an
// AppendError that carries the last stage it reached.
enum class AppendStage {
    Idle,
    ParentWritten,
    KeyResolved,
    PropertiesWritten,
    ExceptionsWritten
};

const char* stageName(AppendStage stage);

class AppendError : public std::runtime_error {
public:
    explicit AppendError(const QString& message);

    AppendStage stage() const { return m_stage; }
    void setStage(AppendStage stage) { m_stage = stage; }

private:
    AppendStage m_stage{AppendStage::Idle};
};

// Statement preparation or execution failed.
class WriteError : public AppendError {
public:
    using AppendError::AppendError;
};

// Neither generated keys nor the dialect's insert-id query yielded an id.
class KeyResolutionError : public AppendError {
public:
    using AppendError::AppendError;
};

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const QString& message);
};

}  // namespace logdb
