#include "reconstruct/Stages.hpp"
#include "reconstruct/Kernels.hpp"
#include "Log.hpp"
#include <omp.h>
#include <string>

namespace swash {

    namespace {
        void depth_from_elevation(const Array2D& w, const Array2D& b, Array2D& h) {
            #pragma omp parallel for
            for (int j = 0; j < h.rows(); ++j) {
                for (int i = 0; i < h.cols(); ++i) {
                    h(j, i) = w(j, i) - b(j, i);
                }
            }
        }

        void snap_depth(Array2D& h, double tol) {
            #pragma omp parallel for
            for (int j = 0; j < h.rows(); ++j) {
                for (int i = 0; i < h.cols(); ++i) {
                    h(j, i) = snap_to_zero(h(j, i), tol);
                }
            }
        }

        long clamp_negative(double& h) {
            if (h < 0.0) {
                h = 0.0;
                return 1;
            }
            return 0;
        }
    }

    DepthCorrection correct_negative_depth(
        States& states, const Grid& grid, const Topography& topo, double tol)
    {
        states.check(grid);
        topo.check(grid);

        const int ngh = grid.ngh;
        const int nx = grid.nx;
        const int ny = grid.ny;

        Array2D& hc = states.U.h;
        Array2D& hxm = states.face.x.minus.U.h;
        Array2D& hxp = states.face.x.plus.U.h;
        Array2D& hym = states.face.y.minus.U.h;
        Array2D& hyp = states.face.y.plus.U.h;

        // 1. Depth = elevation - bed, at centers and on every face array
        #pragma omp parallel for
        for (int j = 0; j < ny; ++j) {
            for (int i = 0; i < nx; ++i) {
                hc(j, i) = states.Q.w(ngh + j, ngh + i) - topo.cntr(j, i);
            }
        }
        depth_from_elevation(states.face.x.minus.Q.w, topo.xfcntr, hxm);
        depth_from_elevation(states.face.x.plus.Q.w,  topo.xfcntr, hxp);
        depth_from_elevation(states.face.y.minus.Q.w, topo.yfcntr, hym);
        depth_from_elevation(states.face.y.plus.Q.w,  topo.yfcntr, hyp);

        DepthCorrection stats;
        long x_pairs = 0, y_pairs = 0, boundary = 0;

        // 2. Interior cells: a cell owns the "plus" value of its left/bottom face and the
        //    "minus" value of its right/top face, so no two cells write the same element
        #pragma omp parallel for reduction(+:x_pairs, y_pairs)
        for (int j = 0; j < ny; ++j) {
            for (int i = 0; i < nx; ++i) {
                if (fix_negative_depth_pair(hc(j, i), hxp(j, i), hxm(j, i + 1))) ++x_pairs;
                if (fix_negative_depth_pair(hc(j, i), hyp(j, i), hym(j + 1, i))) ++y_pairs;
            }
        }

        // 3. Outermost faces come from ghost cells; clamp without redistribution
        for (int j = 0; j < ny; ++j) {
            boundary += clamp_negative(hxm(j, 0));
            boundary += clamp_negative(hxp(j, nx));
        }
        for (int i = 0; i < nx; ++i) {
            boundary += clamp_negative(hym(0, i));
            boundary += clamp_negative(hyp(ny, i));
        }

        // 4. Remove rounding errors
        snap_depth(hc, tol);
        snap_depth(hxm, tol);
        snap_depth(hxp, tol);
        snap_depth(hym, tol);
        snap_depth(hyp, tol);

        stats.x_pairs = x_pairs;
        stats.y_pairs = y_pairs;
        stats.boundary = boundary;

        if (log_debug_enabled() && (x_pairs > 0 || y_pairs > 0 || boundary > 0)) {
            log_message(LogProfile::debug,
                "negative depth fixed: " + std::to_string(x_pairs) + " cells in x, " +
                std::to_string(y_pairs) + " cells in y, " +
                std::to_string(boundary) + " boundary faces");
        }

        return stats;
    }
}
