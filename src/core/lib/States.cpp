#include "States.hpp"

namespace swash {

    void WHUHV::check(int rows, int cols, const std::string& name) const {
        Grid::require_shape(w, rows, cols, name + ".w");
        Grid::require_shape(hu, rows, cols, name + ".hu");
        Grid::require_shape(hv, rows, cols, name + ".hv");
    }

    void HUV::check(int rows, int cols, const std::string& name) const {
        Grid::require_shape(h, rows, cols, name + ".h");
        Grid::require_shape(u, rows, cols, name + ".u");
        Grid::require_shape(v, rows, cols, name + ".v");
    }

    States::States(const Grid& grid)
        : Q(grid.padded_rows(), grid.padded_cols()),
          U(grid.ny, grid.nx)
    {
        slp.x = WHUHV(grid.ny, grid.nx + 2);
        slp.y = WHUHV(grid.ny + 2, grid.nx);
        face.x = FacePair(grid.ny, grid.nx + 1);
        face.y = FacePair(grid.ny + 1, grid.nx);
    }

    void States::check(const Grid& grid) const {
        Q.check(grid.padded_rows(), grid.padded_cols(), "Q");
        U.check(grid.ny, grid.nx, "U");

        slp.x.check(grid.ny, grid.nx + 2, "slp.x");
        slp.y.check(grid.ny + 2, grid.nx, "slp.y");

        // --- X Faces ---
        face.x.minus.Q.check(grid.ny, grid.nx + 1, "face.x.minus.Q");
        face.x.minus.U.check(grid.ny, grid.nx + 1, "face.x.minus.U");
        face.x.plus.Q.check(grid.ny, grid.nx + 1, "face.x.plus.Q");
        face.x.plus.U.check(grid.ny, grid.nx + 1, "face.x.plus.U");

        // --- Y Faces ---
        face.y.minus.Q.check(grid.ny + 1, grid.nx, "face.y.minus.Q");
        face.y.minus.U.check(grid.ny + 1, grid.nx, "face.y.minus.U");
        face.y.plus.Q.check(grid.ny + 1, grid.nx, "face.y.plus.Q");
        face.y.plus.U.check(grid.ny + 1, grid.nx, "face.y.plus.U");
    }
}
