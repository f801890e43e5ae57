#include "graphview/view/ViewSession.h"
#include "graphview/common/Logger.h"

namespace graphview {

ViewSession& ViewSessionStore::get(const std::string& surfaceId) {
    auto [it, inserted] = sessions_.try_emplace(surfaceId);
    if (inserted) {
        LOG_DEBUG("Created view session '{}'", surfaceId);
    }
    return it->second;
}

bool ViewSessionStore::contains(const std::string& surfaceId) const {
    return sessions_.count(surfaceId) > 0;
}

bool ViewSessionStore::reset(const std::string& surfaceId) {
    auto it = sessions_.find(surfaceId);
    if (it == sessions_.end()) {
        return false;
    }
    it->second.reset();
    return true;
}

bool ViewSessionStore::remove(const std::string& surfaceId) {
    return sessions_.erase(surfaceId) > 0;
}

}  // namespace graphview
