#pragma once

#include <stdexcept>
#include <string>

namespace lc::pipeline {

enum class FailureReason {
    MappingNotFound,
    MappingUnavailable,
    AuthFailure,
    NetworkFailure,
    RemoteIOFailure,
    CollisionUnresolved,
    LocalIOFailure
};

std::string to_string(FailureReason reason);

class PipelineError : public std::runtime_error {
public:
    PipelineError(const FailureReason reason, const std::string& what, const bool retryable)
        : std::runtime_error(what), reason_(reason), retryable_(retryable) {}

    [[nodiscard]] FailureReason reason() const noexcept { return reason_; }
    [[nodiscard]] bool retryable() const noexcept { return retryable_; }

private:
    FailureReason reason_;
    bool retryable_;
};

class MappingNotFound final : public PipelineError {
public:
    explicit MappingNotFound(const std::string& what)
        : PipelineError(FailureReason::MappingNotFound, what, false) {}
};

// Mapping backend unreachable; the mapping itself may well exist
class MappingUnavailable final : public PipelineError {
public:
    explicit MappingUnavailable(const std::string& what)
        : PipelineError(FailureReason::MappingUnavailable, what, true) {}
};

class TransferError final : public PipelineError {
public:
    TransferError(const FailureReason reason, const std::string& what, const bool retryable)
        : PipelineError(reason, what, retryable) {}

    static TransferError auth(const std::string& what) { return {FailureReason::AuthFailure, what, false}; }
    static TransferError network(const std::string& what) { return {FailureReason::NetworkFailure, what, true}; }
    static TransferError remoteIO(const std::string& what, const bool retryable = true) {
        return {FailureReason::RemoteIOFailure, what, retryable};
    }
};

class ArchiveError final : public PipelineError {
public:
    ArchiveError(const FailureReason reason, const std::string& what, const bool retryable)
        : PipelineError(reason, what, retryable) {}

    static ArchiveError collision(const std::string& what) { return {FailureReason::CollisionUnresolved, what, false}; }
    static ArchiveError localIO(const std::string& what) { return {FailureReason::LocalIOFailure, what, true}; }
};

}
