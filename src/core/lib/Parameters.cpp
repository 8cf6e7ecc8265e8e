#include "Parameters.hpp"
#include <stdexcept>
#include <string>

namespace swash {

    void Parameters::validate() const {
        if (!(theta >= 1.0 && theta <= 2.0)) {
            throw std::invalid_argument("Parameters: theta must lie in [1, 2], got " + std::to_string(theta));
        }
        if (!(drytol >= 0.0)) {
            throw std::invalid_argument("Parameters: drytol must be non-negative, got " + std::to_string(drytol));
        }
        if (!(tol >= 0.0)) {
            throw std::invalid_argument("Parameters: tol must be non-negative, got " + std::to_string(tol));
        }
    }
}
