#include "types/History.hpp"

std::string lc::types::to_string(const History::Status status) {
    switch (status) {
        case History::Status::Sent: return "sent";
        case History::Status::Failed: return "failed";
    }
    return "unknown";
}
