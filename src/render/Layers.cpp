#include "graphview/render/Layers.h"
#include "graphview/render/IPainter.h"

#include <iterator>

namespace graphview {

void Layers::append(std::vector<Shape>& dst, std::vector<Shape>&& src) {
    dst.insert(dst.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
}

void Layers::addEdgeShapes(std::vector<Shape> shapes, bool top) {
    append(top ? top_.edges : base_.edges, std::move(shapes));
}

void Layers::addNodeShapes(std::vector<Shape> shapes, bool top) {
    append(top ? top_.nodes : base_.nodes, std::move(shapes));
}

void Layers::paint(IPainter& painter) const {
    for (const Layer* layer : {&base_, &top_}) {
        for (const auto& shape : layer->edges) {
            painter.paint(shape);
        }
        for (const auto& shape : layer->nodes) {
            painter.paint(shape);
        }
    }
}

std::vector<Shape> Layers::ordered() const {
    std::vector<Shape> result;
    result.reserve(size());
    for (const Layer* layer : {&base_, &top_}) {
        result.insert(result.end(), layer->edges.begin(), layer->edges.end());
        result.insert(result.end(), layer->nodes.begin(), layer->nodes.end());
    }
    return result;
}

size_t Layers::size() const {
    return base_.edges.size() + base_.nodes.size() + top_.edges.size() + top_.nodes.size();
}

void Layers::clear() {
    base_ = {};
    top_ = {};
}

}  // namespace graphview
