#include "pipeline/errors.hpp"

std::string lc::pipeline::to_string(const FailureReason reason) {
    switch (reason) {
        case FailureReason::MappingNotFound: return "MappingNotFound";
        case FailureReason::MappingUnavailable: return "MappingUnavailable";
        case FailureReason::AuthFailure: return "AuthFailure";
        case FailureReason::NetworkFailure: return "NetworkFailure";
        case FailureReason::RemoteIOFailure: return "RemoteIOFailure";
        case FailureReason::CollisionUnresolved: return "CollisionUnresolved";
        case FailureReason::LocalIOFailure: return "LocalIOFailure";
    }
    return "Unknown";
}
