#pragma once
#include "Reconstructor.hpp"
#include "Stages.hpp"

namespace swash {

    // Second order: piecewise-linear with the theta-minmod limiter
    class MinmodReconstructor : public Reconstructor {
    public:
        using Reconstructor::Reconstructor;
        MinmodReconstructor() : Reconstructor(Parameters()) {}

    protected:
        void compute_slopes(States& states, const Grid& grid) const override {
            minmod_slope(states, grid, m_params.theta, m_params.tol);
        }
    };
}
