#include "overlays.hpp"

#include <algorithm>

namespace gfaestus {

using namespace std;

bool RGBA::operator==(const RGBA& other) const {
    return r == other.r && g == other.g && b == other.b && a == other.a;
}

bool RGBA::operator!=(const RGBA& other) const {
    return !(*this == other);
}

ostream& operator<<(ostream& out, const RGBA& color) {
    return out << "rgba(" << color.r << ", " << color.g << ", " << color.b << ", " << color.a << ")";
}

RGBA hash_node_color(uint64_t hash) {
    uint16_t r = (uint16_t) ((hash >> 32) & 0xFFFFFFFF);
    uint16_t g = (uint16_t) ((hash >> 16) & 0xFFFFFFFF);
    uint16_t b = (uint16_t) (hash & 0xFFFFFFFF);

    float max = (float) std::max(r, std::max(g, b));
    if (max == 0.0) {
        return RGBA(0.0, 0.0, 0.0);
    }
    return RGBA(r / max, g / max, b / max);
}

OverlayData::OverlayData(vector<RGBA>&& colors) : overlay_kind(RGB), color_data(std::move(colors)) {
    // Nothing to do
}

OverlayData::OverlayData(vector<float>&& values) : overlay_kind(Value), value_data(std::move(values)) {
    // Nothing to do
}

OverlayData::Kind OverlayData::kind() const {
    return overlay_kind;
}

size_t OverlayData::size() const {
    return overlay_kind == RGB ? color_data.size() : value_data.size();
}

const vector<RGBA>& OverlayData::colors() const {
    return color_data;
}

const vector<float>& OverlayData::values() const {
    return value_data;
}

}
