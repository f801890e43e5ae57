#include "graphview/view/Viewport.h"

#include <algorithm>
#include <cmath>

namespace graphview {

bool Viewport::zoomAt(float delta, const Point& anchor) {
    float newZoom = zoom * (1.0f + delta);
    if (!std::isfinite(newZoom) || newZoom <= 0.0f || !anchor.isFinite()) {
        return false;
    }

    Point graphAnchor = screenToCanvas(anchor);
    pan = anchor - graphAnchor * newZoom;
    zoom = newZoom;
    return true;
}

void Viewport::fitToScreen(const Bounds& bounds, const Rect& canvas, float padding) {
    Point diag = bounds.diagonal();
    if (diag.isZero()) {
        diag = DEFAULT_FIT_DIAGONAL;
    }

    Point graphSize = diag * (1.0f + padding);

    // The smaller factor keeps both axes inside the canvas
    float zoomX = canvas.width / graphSize.x;
    float zoomY = canvas.height / graphSize.y;
    float newZoom = std::min(zoomX, zoomY);

    // A degenerate canvas (not laid out yet) leaves the viewport alone
    if (!std::isfinite(newZoom) || newZoom <= 0.0f) {
        return;
    }

    zoom = newZoom;
    pan = canvas.center() - bounds.center() * newZoom;
}

void Viewport::reset() {
    *this = Viewport{};
}

}  // namespace graphview
