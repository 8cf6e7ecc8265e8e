#include "Topography.hpp"
#include <utility>

namespace swash {

    Topography::Topography(const Grid& grid, Array2D _cntr, Array2D _xfcntr, Array2D _yfcntr)
        : cntr(std::move(_cntr)), xfcntr(std::move(_xfcntr)), yfcntr(std::move(_yfcntr))
    {
        check(grid);
    }

    void Topography::check(const Grid& grid) const {
        Grid::require_shape(cntr, grid.ny, grid.nx, "topo.cntr");
        Grid::require_shape(xfcntr, grid.ny, grid.nx + 1, "topo.xfcntr");
        Grid::require_shape(yfcntr, grid.ny + 1, grid.nx, "topo.yfcntr");
    }

    Topography Topography::from_vertices(const Grid& grid, const Array2D& vert) {
        Grid::require_shape(vert, grid.ny + 1, grid.nx + 1, "topo.vert");

        const int nx = grid.nx;
        const int ny = grid.ny;
        Array2D cntr(ny, nx), xf(ny, nx + 1), yf(ny + 1, nx);

        // Center = mean of the four corners
        for (int j = 0; j < ny; ++j) {
            for (int i = 0; i < nx; ++i) {
                cntr(j, i) = (vert(j, i) + vert(j, i + 1) + vert(j + 1, i) + vert(j + 1, i + 1)) / 4.0;
            }
        }

        // X-face = mean of the two vertices on its vertical edge
        for (int j = 0; j < ny; ++j) {
            for (int i = 0; i < nx + 1; ++i) {
                xf(j, i) = (vert(j, i) + vert(j + 1, i)) / 2.0;
            }
        }

        // Y-face = mean of the two vertices on its horizontal edge
        for (int j = 0; j < ny + 1; ++j) {
            for (int i = 0; i < nx; ++i) {
                yf(j, i) = (vert(j, i) + vert(j, i + 1)) / 2.0;
            }
        }

        return Topography(grid, std::move(cntr), std::move(xf), std::move(yf));
    }
}
