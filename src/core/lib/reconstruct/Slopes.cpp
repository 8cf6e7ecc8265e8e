#include "reconstruct/Stages.hpp"
#include "reconstruct/Kernels.hpp"
#include <omp.h>

namespace swash {

    namespace {
        void slope_x(const Array2D& q, Array2D& slp, const Grid& grid, double theta, double tol) {
            const int ngh = grid.ngh;

            #pragma omp parallel for
            for (int j = 0; j < grid.ny; ++j) {
                // slp column c belongs to padded column ngh - 1 + c
                for (int c = 0; c < grid.nx + 2; ++c) {
                    const int jj = ngh + j;
                    const int ii = ngh - 1 + c;
                    slp(j, c) = theta_minmod(q(jj, ii - 1), q(jj, ii), q(jj, ii + 1), theta, tol);
                }
            }
        }

        void slope_y(const Array2D& q, Array2D& slp, const Grid& grid, double theta, double tol) {
            const int ngh = grid.ngh;

            #pragma omp parallel for
            for (int r = 0; r < grid.ny + 2; ++r) {
                for (int i = 0; i < grid.nx; ++i) {
                    const int jj = ngh - 1 + r;
                    const int ii = ngh + i;
                    slp(r, i) = theta_minmod(q(jj - 1, ii), q(jj, ii), q(jj + 1, ii), theta, tol);
                }
            }
        }
    }

    void minmod_slope(States& states, const Grid& grid, double theta, double tol) {
        states.check(grid);

        slope_x(states.Q.w,  states.slp.x.w,  grid, theta, tol);
        slope_x(states.Q.hu, states.slp.x.hu, grid, theta, tol);
        slope_x(states.Q.hv, states.slp.x.hv, grid, theta, tol);

        slope_y(states.Q.w,  states.slp.y.w,  grid, theta, tol);
        slope_y(states.Q.hu, states.slp.y.hu, grid, theta, tol);
        slope_y(states.Q.hv, states.slp.y.hv, grid, theta, tol);
    }

    void zero_slope(States& states) {
        states.slp.x.w.fill(0.0);
        states.slp.x.hu.fill(0.0);
        states.slp.x.hv.fill(0.0);

        states.slp.y.w.fill(0.0);
        states.slp.y.hu.fill(0.0);
        states.slp.y.hv.fill(0.0);
    }
}
