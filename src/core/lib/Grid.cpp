#include "Grid.hpp"
#include <stdexcept>

namespace swash {

    Grid::Grid(int _nx, int _ny, int _ngh, double _dx, double _dy)
        : nx(_nx), ny(_ny), ngh(_ngh), dx(_dx), dy(_dy)
    {
        if (nx <= 0 || ny <= 0) {
            throw std::invalid_argument(
                "Grid: interior extents must be positive, got nx=" + std::to_string(nx) +
                ", ny=" + std::to_string(ny));
        }
        if (ngh < stencil_half_width) {
            throw std::invalid_argument(
                "Grid: at least " + std::to_string(stencil_half_width) +
                " ghost cell layers are required, got ngh=" + std::to_string(ngh));
        }
        if (!(dx > 0.0) || !(dy > 0.0)) {
            throw std::invalid_argument("Grid: cell sizes dx and dy must be positive");
        }
    }

    void Grid::require_shape(const Array2D& arr, int rows, int cols, const std::string& name) {
        if (!arr.has_shape(rows, cols)) {
            throw std::invalid_argument(
                name + ": expected shape (" + std::to_string(rows) + ", " + std::to_string(cols) +
                "), got " + arr.shape_str());
        }
    }
}
