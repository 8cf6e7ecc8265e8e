#pragma once
#include <cmath>

namespace swash {

    /**
     * Generalized (theta) minmod limiter in ratio form.
     * Inputs: upstream s1, center s2, downstream s3 of one component along one direction.
     * Output: half of the limited variation across the center cell, i.e. the amount
     * added to reach the right/top face and subtracted to reach the left/bottom face.
     *
     * A downstream difference with magnitude <= tol yields 0, which is also the limit
     * of the formula as the difference goes to zero.
     */
    inline double theta_minmod(double s1, double s2, double s3, double theta, double tol) {
        double denominator = s3 - s2;
        if (std::abs(denominator) <= tol) {
            return 0.0;
        }

        double slp = (s2 - s1) / denominator;
        slp = std::fmin(slp * theta, (1.0 + slp) / 2.0);
        slp = std::fmin(slp, theta);
        slp = std::fmax(slp, 0.0);
        return slp * denominator / 2.0;
    }

    /**
     * Repairs the two depths a cell contributes to its internal faces (left/bottom, right/top).
     * A negative side is clamped to 0 and the other side becomes 2 * h_center, so the pair
     * still averages to h_center. If both sides are negative, both are clamped to 0.
     * Returns true when anything changed.
     */
    inline bool fix_negative_depth_pair(double h_center, double& h_left, double& h_right) {
        const bool left_neg = h_left < 0.0;
        const bool right_neg = h_right < 0.0;
        const double two_h = 2.0 * h_center;

        const double new_left = left_neg ? 0.0 : (right_neg ? two_h : h_left);
        const double new_right = right_neg ? 0.0 : (left_neg ? two_h : h_right);

        h_left = new_left;
        h_right = new_right;
        return left_neg || right_neg;
    }

    // Rounding-noise suppression; also removes any remaining negative value
    inline double snap_to_zero(double h, double tol) {
        return (h < tol) ? 0.0 : h;
    }
}
