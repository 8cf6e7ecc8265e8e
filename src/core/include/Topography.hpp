#pragma once
#include "Array2D.hpp"
#include "Grid.hpp"

namespace swash {

    // Read-only bed elevation sampled at cell centers and face centers (no ghost padding).
    class Topography {
    public:
        Array2D cntr;    // (ny, nx)
        Array2D xfcntr;  // (ny, nx + 1), faces normal to x
        Array2D yfcntr;  // (ny + 1, nx), faces normal to y

        // Takes already sampled arrays; throws std::invalid_argument if they do not match `grid`
        Topography(const Grid& grid, Array2D _cntr, Array2D _xfcntr, Array2D _yfcntr);

        // Samples the three arrays from elevations at cell vertices, shape (ny + 1, nx + 1)
        static Topography from_vertices(const Grid& grid, const Array2D& vert);

        void check(const Grid& grid) const;
    };
}
