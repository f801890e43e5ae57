#pragma once

#include "ILayoutMode.h"

namespace graphview {

/// Nodes stay where the user or the builder put them
class StaticLayout : public ILayoutMode {
public:
    const char* name() const override { return "static"; }
    bool step(Graph& /*graph*/) override { return false; }
    bool isRunning() const override { return false; }
};

}  // namespace graphview
