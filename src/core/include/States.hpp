#pragma once
#include <string>
#include "Array2D.hpp"
#include "Grid.hpp"
#include "types.hpp"

namespace swash {

    // Conservative fields: surface elevation and the two momenta
    struct WHUHV {
        Array2D w, hu, hv;

        WHUHV() = default;
        WHUHV(int rows, int cols) : w(rows, cols), hu(rows, cols), hv(rows, cols) {}

        Conserved at(int j, int i) const { return {w(j, i), hu(j, i), hv(j, i)}; }
        void set(int j, int i, const Conserved& q) {
            w(j, i) = q.w;
            hu(j, i) = q.hu;
            hv(j, i) = q.hv;
        }

        void check(int rows, int cols, const std::string& name) const;
    };

    // Non-conservative fields: depth and the two velocities
    struct HUV {
        Array2D h, u, v;

        HUV() = default;
        HUV(int rows, int cols) : h(rows, cols), u(rows, cols), v(rows, cols) {}

        Primitive at(int j, int i) const { return {h(j, i), u(j, i), v(j, i)}; }
        void set(int j, int i, const Primitive& p) {
            h(j, i) = p.h;
            u(j, i) = p.u;
            v(j, i) = p.v;
        }

        void check(int rows, int cols, const std::string& name) const;
    };

    // Discontinuous values on one side of a set of faces
    struct FaceState {
        WHUHV Q;
        HUV U;

        FaceState() = default;
        FaceState(int rows, int cols) : Q(rows, cols), U(rows, cols) {}
    };

    // "minus" is approached from the left/below, "plus" from the right/above
    struct FacePair {
        FaceState minus, plus;

        FacePair() = default;
        FacePair(int rows, int cols) : minus(rows, cols), plus(rows, cols) {}
    };

    struct Faces {
        FacePair x, y;
    };

    // Half of the limited variation across a cell, per direction
    struct Slopes {
        WHUHV x, y;
    };

    /**
     * Solver state touched by one reconstruction call.
     *
     * Shapes (rows, cols):
     *   Q        (ny + 2 ngh, nx + 2 ngh)   cell centers with ghosts, read only
     *   U        (ny, nx)                   interior cell centers
     *   slp.x    (ny, nx + 2)               interior rows, one extra cell per side
     *   slp.y    (ny + 2, nx)
     *   face.x.* (ny, nx + 1)
     *   face.y.* (ny + 1, nx)
     */
    class States {
    public:
        WHUHV Q;
        HUV U;
        Slopes slp;
        Faces face;

        States() = default;
        explicit States(const Grid& grid);

        // Throws std::invalid_argument naming the first array whose shape does not match `grid`
        void check(const Grid& grid) const;
    };
}
