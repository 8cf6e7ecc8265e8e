#include "reconstruct/Reconstructor.hpp"
#include "reconstruct/Stages.hpp"

namespace swash {

    Reconstructor::Reconstructor(const Parameters& params) : m_params(params) {
        m_params.validate();
    }

    void Reconstructor::reconstruct(States& states, const Grid& grid, const Topography& topo) const {
        states.check(grid);
        topo.check(grid);

        // The stages must run in this order; each consumes the previous one's output
        compute_slopes(states, grid);
        get_discontinuous_cnsrv_q(states, grid);
        correct_negative_depth(states, grid, topo, m_params.tol);
        decompose_variables(states, grid, topo, m_params.drytol);
    }
}
