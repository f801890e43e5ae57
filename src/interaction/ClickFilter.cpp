#include "graphview/interaction/ClickFilter.h"

namespace graphview {

void ClickFilter::apply(FrameInput& input, bool released) {
    if (input.doubleClicked) {
        // Press and release can land in the same frame
        input.clicked = false;
        awaitingRelease_ = !released;
        return;
    }

    if (released && awaitingRelease_) {
        input.clicked = false;
        awaitingRelease_ = false;
    }
}

}  // namespace graphview
