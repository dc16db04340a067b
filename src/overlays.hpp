#ifndef GFAESTUS_OVERLAYS_HPP_INCLUDED
#define GFAESTUS_OVERLAYS_HPP_INCLUDED

/** \file
 * overlays.hpp: per-node colors or values to draw over the graph.
 */

#include <vector>
#include <cstdint>
#include <iostream>

namespace gfaestus {

using namespace std;

/// A color with float channels in [0, 1].
struct RGBA {
    float r = 0.0;
    float g = 0.0;
    float b = 0.0;
    float a = 1.0;

    RGBA() = default;
    RGBA(float r, float g, float b, float a = 1.0) : r(r), g(g), b(b), a(a) {}

    bool operator==(const RGBA& other) const;
    bool operator!=(const RGBA& other) const;
};

ostream& operator<<(ostream& out, const RGBA& color);

/**
 * Turn a hash into an opaque color. The red, green and blue channels come from
 * three adjacent 16-bit windows of the low 48 bits of the hash, scaled so the brightest is 1.
 * A hash with all three windows zero gives black.
 */
RGBA hash_node_color(uint64_t hash);

/**
 * An overlay: one color (RGB overlays) or one number (Value overlays) for
 * each node in the graph, indexed by node ID - 1.
 */
class OverlayData {
public:
    enum Kind {
        RGB,
        Value
    };

    /// Make an empty color overlay
    OverlayData() = default;

    /// Make a color overlay
    OverlayData(vector<RGBA>&& colors);

    /// Make a value overlay
    OverlayData(vector<float>&& values);

    Kind kind() const;

    /// Number of nodes covered
    size_t size() const;

    /// Get the colors. Empty for a value overlay.
    const vector<RGBA>& colors() const;

    /// Get the values. Empty for a color overlay.
    const vector<float>& values() const;

private:
    Kind overlay_kind = RGB;
    vector<RGBA> color_data;
    vector<float> value_data;
};

}

#endif
