#pragma once

#include <stdexcept>
#include <string>

namespace malgraph {

/// Categories of failures raised by the attack graph engine.
enum class MalGraphErrorCode {
    StepExpressionResolution,
    DuplicateNodeId,
    DuplicateNodeName,
    DuplicateAttackerId,
    DuplicateAttackerName,
    UnknownNode,
    UnknownAttacker,
    UnknownAsset,
    UnknownFileFormat,
    InvalidDocument,
    InvalidConfig
};

/// Base exception for all malgraph errors. Carries an error code so callers
/// can distinguish data errors from programming errors.
class MalGraphError : public std::runtime_error {
public:
    MalGraphError(MalGraphErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    MalGraphErrorCode code() const noexcept { return code_; }

private:
    MalGraphErrorCode code_;
};

/// Raised when a "reaches" step expression resolves to an attack step that
/// has no node in the graph. The language specification and the model
/// disagree; the partially built graph must be discarded.
class StepExpressionError : public MalGraphError {
public:
    explicit StepExpressionError(const std::string& message)
        : MalGraphError(MalGraphErrorCode::StepExpressionResolution, message) {}
};

} // namespace malgraph
