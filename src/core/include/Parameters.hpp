#pragma once

namespace swash {

    // Tunable scalars of the reconstruction. Immutable once handed to a Reconstructor.
    struct Parameters {
        double theta = 1.3;     // limiter dissipation, 1 = minmod, 2 = monotonized central
        double drytol = 1e-4;   // below this depth velocities are zero
        double tol = 1e-12;     // below this depth (and limiter denominator) values are zero

        Parameters() = default;
        Parameters(double _theta, double _drytol, double _tol)
            : theta(_theta), drytol(_drytol), tol(_tol) {}

        // Throws std::invalid_argument when theta is outside [1, 2] or a tolerance is negative
        void validate() const;
    };
}
