/**
 * @file reference_element.hpp
 * @brief Local node layout of the reference elements on [0,1] and [0,1]^2
 */

#ifndef HEATFEM_MODELS_REFERENCE_ELEMENT_HPP
#define HEATFEM_MODELS_REFERENCE_ELEMENT_HPP

#include <array>

#include "models/enums.hpp"

namespace reference {

    /**
     * @brief Local nodes of the 9-node quadrilateral
     *
     *   2__5__8      eta
     *   |     |       ^
     *   1  4  7       |
     *   |__ __|       +--> ksi
     *   0  3  6
     *
     * The local index is 3*a + b, where a selects the ksi Lagrange polynomial
     * (node at ksi = 0, 0.5, 1) and b the eta Lagrange polynomial.
     */
    enum QuadraticNode : int {
        BottomLeft  = 0,
        LeftMid     = 1,
        TopLeft     = 2,
        BottomMid   = 3,
        Center      = 4,
        TopMid      = 5,
        BottomRight = 6,
        RightMid    = 7,
        TopRight    = 8
    };

    /**
     * @brief Local nodes of the 4-node quadrilateral
     *
     *   1__ __3
     *   |     |
     *   |__ __|
     *   0     2
     */
    enum LinearNode : int {
        LinearBottomLeft  = 0,
        LinearTopLeft     = 1,
        LinearBottomRight = 2,
        LinearTopRight    = 3
    };

    constexpr int kQuadraticNodes = 9;
    constexpr int kLinearNodes = 4;
    constexpr int kSides = 4;

    // ksi/eta of every quadratic local node
    constexpr std::array<std::array<double, 2>, kQuadraticNodes> kQuadraticNodeCoords = {{
        {{0.0, 0.0}}, {{0.0, 0.5}}, {{0.0, 1.0}},
        {{0.5, 0.0}}, {{0.5, 0.5}}, {{0.5, 1.0}},
        {{1.0, 0.0}}, {{1.0, 0.5}}, {{1.0, 1.0}}
    }};

    // local nodes lying on each side, indexed by BoundarySide, ordered along the edge
    constexpr std::array<std::array<int, 3>, kSides> kQuadraticSideNodes = {{
        {{BottomLeft, BottomMid, BottomRight}},  // bottom (eta = 0)
        {{BottomLeft, LeftMid, TopLeft}},        // left   (ksi = 0)
        {{TopLeft, TopMid, TopRight}},           // top    (eta = 1)
        {{BottomRight, RightMid, TopRight}}      // right  (ksi = 1)
    }};

    inline const std::array<int, 3>& side_nodes(BoundarySide side){
        return kQuadraticSideNodes[static_cast<int>(side)];
    }

    /**
     * @brief Natural coordinates of a point on a side of the reference square
     * @param side Side of the reference element
     * @param s Edge parameter in [0,1]
     * @return {ksi, eta}
     */
    inline std::array<double, 2> side_point(BoundarySide side, double s){
        switch (side) {
            case BoundarySide::Bottom: return {{s, 0.0}};
            case BoundarySide::Left:   return {{0.0, s}};
            case BoundarySide::Top:    return {{s, 1.0}};
            case BoundarySide::Right:  return {{1.0, s}};
        }
        return {{s, 0.0}};
    }

    inline bool is_horizontal(BoundarySide side){
        return side == BoundarySide::Bottom || side == BoundarySide::Top;
    }

    inline int nodes_per_element(ElementOrder order){
        return order == ElementOrder::Quadratic ? kQuadraticNodes : kLinearNodes;
    }
}

#endif // HEATFEM_MODELS_REFERENCE_ELEMENT_HPP
