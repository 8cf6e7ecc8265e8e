#pragma once
#include "Grid.hpp"
#include "States.hpp"
#include "Topography.hpp"

namespace swash {

    // Counters reported by the positivity corrector
    struct DepthCorrection {
        long x_pairs = 0;     // interior cells fixed in x
        long y_pairs = 0;     // interior cells fixed in y
        long boundary = 0;    // outermost faces clamped
    };

    // Every stage taking a Grid throws std::invalid_argument before writing anything
    // when states (or topo) were not allocated for that grid.

    // 1. Limited slopes of w, hu, hv into states.slp (theta minmod)
    void minmod_slope(States& states, const Grid& grid, double theta, double tol);

    // First-order variant of 1.: all slopes are zero
    void zero_slope(States& states);

    // 2. Discontinuous conservative values at every face from Q and states.slp
    void get_discontinuous_cnsrv_q(States& states, const Grid& grid);

    // 3. Depth at centers and faces, mass-conserving repair of negative face depth,
    //    clamping at the domain edge, then snapping of depths below tol to zero
    DepthCorrection correct_negative_depth(
        States& states, const Grid& grid, const Topography& topo, double tol);

    // 4. Face and center velocities from the corrected depth, then w = h + b,
    //    hu = h u, hv = h v on every face
    void decompose_variables(
        States& states, const Grid& grid, const Topography& topo, double drytol);
}
