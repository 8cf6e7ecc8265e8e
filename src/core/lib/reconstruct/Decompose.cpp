#include "reconstruct/Stages.hpp"
#include "types.hpp"
#include <omp.h>

namespace swash {

    namespace {
        // Velocity from the corrected depth, then rebuild Q so that w = h + b, hu = h u, hv = h v hold exactly
        void decompose_face(FaceState& face, const Array2D& b, double drytol) {
            #pragma omp parallel for
            for (int j = 0; j < face.U.h.rows(); ++j) {
                for (int i = 0; i < face.U.h.cols(); ++i) {
                    const double h = face.U.h(j, i);
                    Primitive p(h,
                                Primitive::velocity(h, face.Q.hu(j, i), drytol),
                                Primitive::velocity(h, face.Q.hv(j, i), drytol));

                    face.U.set(j, i, p);
                    face.Q.set(j, i, p.to_conserved(b(j, i)));
                }
            }
        }
    }

    void decompose_variables(
        States& states, const Grid& grid, const Topography& topo, double drytol)
    {
        states.check(grid);
        topo.check(grid);

        const int ngh = grid.ngh;

        // Cell centers: depth was already set (and snapped) by the positivity corrector
        #pragma omp parallel for
        for (int j = 0; j < grid.ny; ++j) {
            for (int i = 0; i < grid.nx; ++i) {
                const double h = states.U.h(j, i);
                states.U.u(j, i) = Primitive::velocity(h, states.Q.hu(ngh + j, ngh + i), drytol);
                states.U.v(j, i) = Primitive::velocity(h, states.Q.hv(ngh + j, ngh + i), drytol);
            }
        }

        decompose_face(states.face.x.minus, topo.xfcntr, drytol);
        decompose_face(states.face.x.plus,  topo.xfcntr, drytol);
        decompose_face(states.face.y.minus, topo.yfcntr, drytol);
        decompose_face(states.face.y.plus,  topo.yfcntr, drytol);
    }
}
