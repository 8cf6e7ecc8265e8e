#pragma once
#include "Grid.hpp"
#include "Parameters.hpp"
#include "States.hpp"
#include "Topography.hpp"

namespace swash {

    class Reconstructor {
    public:
        // Validates the parameters; throws std::invalid_argument when they are out of range
        explicit Reconstructor(const Parameters& params);
        virtual ~Reconstructor() = default;

        /**
         * The Main Contract.
         * Inputs: states.Q (ghost cells populated), the grid and the topography.
         * Output: states.U and the four face states, overwritten in place. states.Q is not modified.
         * Shapes are checked before anything is written; a mismatch throws std::invalid_argument.
         */
        void reconstruct(States& states, const Grid& grid, const Topography& topo) const;

        const Parameters& params() const { return m_params; }

    protected:
        Parameters m_params;

        // Fill states.slp; this is where reconstructors differ
        virtual void compute_slopes(States& states, const Grid& grid) const = 0;
    };
}
