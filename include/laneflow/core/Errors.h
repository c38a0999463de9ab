#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace laneflow {

/// Base class for rejected input: duplicate ids, dangling references,
/// invalid shape attributes. Raised while the Graph is being built, so a
/// rejected diagram never reaches the layout passes.
class StructuralInputError : public std::invalid_argument {
public:
    StructuralInputError(const std::string& message, std::string offendingId)
        : std::invalid_argument(message), offendingId_(std::move(offendingId)) {}

    /// The id (node, group or connection endpoint) that caused the rejection
    const std::string& offendingId() const noexcept { return offendingId_; }

private:
    std::string offendingId_;
};

class DuplicateNodeError : public StructuralInputError {
public:
    explicit DuplicateNodeError(const std::string& id)
        : StructuralInputError("Duplicate node id: '" + id + "'", id) {}
};

class DuplicateGroupError : public StructuralInputError {
public:
    explicit DuplicateGroupError(const std::string& id)
        : StructuralInputError("Duplicate group id: '" + id + "'", id) {}
};

/// A connection endpoint or group reference names an id that does not exist
class UnknownNodeReferenceError : public StructuralInputError {
public:
    UnknownNodeReferenceError(const std::string& message, const std::string& id)
        : StructuralInputError(message, id) {}
};

class InvalidShapeAttributeError : public StructuralInputError {
public:
    InvalidShapeAttributeError(const std::string& message, const std::string& nodeId)
        : StructuralInputError(message, nodeId) {}
};

/// Connections whose source and target are the same node have no routing rule
class UnsupportedSelfLoopError : public StructuralInputError {
public:
    explicit UnsupportedSelfLoopError(const std::string& nodeId)
        : StructuralInputError("Self-loop connections are not supported: '" + nodeId + "'", nodeId) {}
};

/// Internal consistency failure. Indicates a bug in the layout engine, never
/// bad input.
class LayoutInvariantViolation : public std::logic_error {
public:
    explicit LayoutInvariantViolation(const std::string& message)
        : std::logic_error("Layout invariant violated: " + message) {}
};

/// Malformed diagram document: invalid JSON, wrong value types, or schema
/// errors reported by DiagramLoader::validate()
class DiagramParseError : public std::runtime_error {
public:
    explicit DiagramParseError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace laneflow
