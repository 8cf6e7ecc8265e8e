#pragma once
#include <string>
#include "Array2D.hpp"

namespace swash {

    // Interior extents and ghost padding of the local structured grid.
    class Grid {
    public:
        int nx, ny;
        int ngh;
        double dx, dy;

        // Throws std::invalid_argument on empty extents, ngh < 2 or non-positive spacing
        Grid(int _nx, int _ny, int _ngh = 2, double _dx = 1.0, double _dy = 1.0);

        // Cell-center arrays including ghost cells
        int padded_rows() const { return ny + 2 * ngh; }
        int padded_cols() const { return nx + 2 * ngh; }

        // Fails loudly if `arr` does not have the expected shape
        static void require_shape(const Array2D& arr, int rows, int cols, const std::string& name);

        // The limiter reads two cells beyond the interior on each side
        static constexpr int stencil_half_width = 2;
    };
}
