#include "pipeline/model/WatchEvent.hpp"

using namespace lc::pipeline::model;

std::string WatchEvent::kindToString() const {
    switch (kind) {
        case Kind::Created: return "created";
        case Kind::Modified: return "modified";
        case Kind::Moved: return "moved";
        case Kind::Deleted: return "deleted";
    }
    return "unknown";
}
