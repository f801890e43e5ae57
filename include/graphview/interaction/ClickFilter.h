#pragma once

#include "FrameInput.h"

namespace graphview {

/// Keeps a double click from also reaching the controller as a single click.
///
/// Toolkits that report a click on every button release send one for the
/// release that closes a double click. Hosts run each FrameInput through
/// apply() before handing it to the view.
class ClickFilter {
public:
    /// @param released Primary button went up this frame, whether or not
    ///                 the toolkit counted it as a click
    void apply(FrameInput& input, bool released);

    /// A double click was seen and its release has not arrived yet
    bool awaitingRelease() const { return awaitingRelease_; }

    void reset() { awaitingRelease_ = false; }

private:
    bool awaitingRelease_ = false;
};

}  // namespace graphview
