#pragma once
#include "Reconstructor.hpp"
#include "Stages.hpp"

namespace swash {

    // First order: faces take the cell-center value, then go through the same depth fix
    class PiecewiseConstantReconstructor : public Reconstructor {
    public:
        using Reconstructor::Reconstructor;
        PiecewiseConstantReconstructor() : Reconstructor(Parameters()) {}

    protected:
        void compute_slopes(States& states, const Grid&) const override {
            zero_slope(states);
        }
    };
}
