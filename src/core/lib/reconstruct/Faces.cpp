#include "reconstruct/Stages.hpp"
#include <omp.h>

namespace swash {

    void get_discontinuous_cnsrv_q(States& states, const Grid& grid) {
        states.check(grid);

        const int ngh = grid.ngh;
        const int nx = grid.nx;
        const int ny = grid.ny;

        const WHUHV& Q = states.Q;
        FacePair& fx = states.face.x;
        FacePair& fy = states.face.y;

        // --- X Faces ---
        // Face f sits between padded columns ngh - 1 + f (its "minus" cell) and ngh + f ("plus" cell).
        // slp.x column c belongs to padded column ngh - 1 + c.
        #pragma omp parallel for
        for (int j = 0; j < ny; ++j) {
            const int jj = ngh + j;
            for (int f = 0; f < nx + 1; ++f) {
                fx.minus.Q.set(j, f, Q.at(jj, ngh - 1 + f) + states.slp.x.at(j, f));
                fx.plus.Q.set(j, f,  Q.at(jj, ngh + f)     - states.slp.x.at(j, f + 1));
            }
        }

        // --- Y Faces ---
        #pragma omp parallel for
        for (int f = 0; f < ny + 1; ++f) {
            for (int i = 0; i < nx; ++i) {
                const int ii = ngh + i;
                fy.minus.Q.set(f, i, Q.at(ngh - 1 + f, ii) + states.slp.y.at(f, i));
                fy.plus.Q.set(f, i,  Q.at(ngh + f, ii)     - states.slp.y.at(f + 1, i));
            }
        }
    }
}
