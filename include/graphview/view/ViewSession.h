#pragma once

#include "Viewport.h"

#include <string>
#include <unordered_map>

namespace graphview {

/// Per-surface state that outlives a frame
struct ViewSession {
    Viewport viewport;

    /// Background drag in progress. Node drags are tracked on the node itself.
    bool panning = false;

    void reset() {
        viewport.reset();
        panning = false;
    }
};

/// Sessions keyed by hosting surface id, created on first use
class ViewSessionStore {
public:
    /// Session for surfaceId, default-constructed if new
    ViewSession& get(const std::string& surfaceId);

    bool contains(const std::string& surfaceId) const;

    /// Restore defaults. Returns false if no such session exists.
    bool reset(const std::string& surfaceId);

    bool remove(const std::string& surfaceId);

    void clear() { sessions_.clear(); }
    size_t size() const { return sessions_.size(); }

private:
    std::unordered_map<std::string, ViewSession> sessions_;
};

}  // namespace graphview
