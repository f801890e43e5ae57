#pragma once

/// @file graphview.h
/// @brief Main header for the GraphView interactive graph widget library
///
/// GraphView draws a node-link multigraph on a 2D canvas and lets the user
/// pan, zoom, select and drag nodes. Parallel edges and self-loops get
/// their own geometry, and an optional force-directed layout animates the
/// graph. The hosting toolkit supplies a FrameInput each frame and an
/// IPainter to draw with.
///
/// Example usage:
/// @code
/// #include <graphview/graphview.h>
///
/// graphview::Topology topology;
/// topology.nodes = {{}, {}, {}};
/// topology.edges = {{0, 1, {}}, {1, 2, {}}, {2, 0, {}}};
///
/// graphview::GraphBuilder builder;
/// graphview::Graph graph = builder.fromTopology(topology);
///
/// graphview::ViewSessionStore sessions;
/// graphview::GraphView view(graph);
/// view.withInteractions({true, true, true, false});
///
/// // every frame
/// auto result = view.frame(sessions.get("main"), input, painter);
/// @endcode

// Core module - Graph data structures
#include "core/Types.h"
#include "core/Graph.h"
#include "core/GraphBuilder.h"

// Configuration
#include "config/Settings.h"
#include "config/SettingsSerializer.h"

// View state
#include "view/Viewport.h"
#include "view/ViewSession.h"
#include "view/ComputedState.h"

// Interaction
#include "interaction/Event.h"
#include "interaction/ClickFilter.h"
#include "interaction/EventChannel.h"
#include "interaction/FrameInput.h"
#include "interaction/InteractionController.h"

// Rendering
#include "render/Shape.h"
#include "render/IPainter.h"
#include "render/EdgeGeometry.h"
#include "render/NodeShape.h"
#include "render/EdgeShape.h"
#include "render/Layers.h"
#include "render/Drawer.h"

// Layout modes
#include "layout/ILayoutMode.h"
#include "layout/StaticLayout.h"
#include "layout/ForceSimulation.h"
#include "layout/ForceLayout.h"

#include "GraphView.h"

#include <string>

namespace graphview {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace graphview
