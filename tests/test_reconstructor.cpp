#include "test_utils.h"

#include <memory>
#include <random>
#include <stdexcept>

#include "reconstruct/Minmod.hpp"
#include "reconstruct/PiecewiseConstant.hpp"
#include "reconstruct/Stages.hpp"

using namespace swash;

namespace {

// Receding shoreline: five cells along x, a single row in y, flat bed at 0
class ShorelineStripTest : public ::testing::Test {
protected:
    Grid grid{5, 1, 2};
    States states{grid};
    Topography topo = test::flat_topography(grid);
    MinmodReconstructor recon{Parameters(1.3, 1e-3, 1e-10)};

    void SetUp() override {
        const double depth[5] = {1.0, 1.0, 1.0, 0.01, -0.5};
        for (int i = 0; i < grid.nx; ++i) {
            states.Q.w(grid.ngh, grid.ngh + i) = depth[i];
            states.Q.hu(grid.ngh, grid.ngh + i) = 0.1;
            states.Q.hv(grid.ngh, grid.ngh + i) = 0.0;
        }
        test::extrapolate_ghosts(states.Q, grid);
    }
};

} // namespace

TEST_F(ShorelineStripTest, LimitedSlopeAtTheShoreline) {
    recon.reconstruct(states, grid, topo);

    // slp.x column c belongs to padded column ngh - 1 + c; interior cell 3 -> c = 4
    EXPECT_NEAR(states.slp.x.w(0, 4), -0.3315, 1e-12);
    EXPECT_EQ(states.slp.x.w(0, 3), 0.0);
    EXPECT_EQ(states.slp.x.w(0, 5), 0.0);
}

TEST_F(ShorelineStripTest, NegativeFaceDepthIsRedistributed) {
    recon.reconstruct(states, grid, topo);

    const Array2D& hm = states.face.x.minus.U.h;
    const Array2D& hp = states.face.x.plus.U.h;

    // Cell 3 (h = 0.01): right face went negative, left face takes 2 h
    EXPECT_EQ(hp(0, 3), 0.02);
    EXPECT_EQ(hm(0, 4), 0.0);
    EXPECT_DOUBLE_EQ((hp(0, 3) + hm(0, 4)) / 2.0, 0.01);

    // Cell 4 (h = -0.5): both sides negative
    EXPECT_EQ(hp(0, 4), 0.0);
    EXPECT_EQ(hm(0, 5), 0.0);

    // Outermost right face comes from a dry ghost cell
    EXPECT_EQ(hp(0, 5), 0.0);

    for (int f = 0; f < 4; ++f) {
        EXPECT_EQ(hm(0, f), 1.0);
    }
    for (int f = 0; f < 3; ++f) {
        EXPECT_EQ(hp(0, f), 1.0);
    }

    EXPECT_EQ(states.U.h(0, 3), 0.01);
    EXPECT_EQ(states.U.h(0, 4), 0.0);
}

TEST_F(ShorelineStripTest, DryFacesHaveZeroVelocityAndSurfaceEqualsDepth) {
    recon.reconstruct(states, grid, topo);

    for (const auto& view : test::all_faces(states, topo)) {
        const FaceState& f = *view.face;
        for (int j = 0; j < f.U.h.rows(); ++j) {
            for (int i = 0; i < f.U.h.cols(); ++i) {
                EXPECT_EQ(f.Q.w(j, i), f.U.h(j, i)) << view.name;
                EXPECT_GE(f.U.h(j, i), 0.0) << view.name;
                if (f.U.h(j, i) < 1e-3) {
                    EXPECT_EQ(f.U.u(j, i), 0.0) << view.name;
                    EXPECT_EQ(f.U.v(j, i), 0.0) << view.name;
                    EXPECT_EQ(f.Q.hu(j, i), 0.0) << view.name;
                }
            }
        }
    }

    EXPECT_DOUBLE_EQ(states.face.x.plus.U.u(0, 3), 5.0);
    EXPECT_DOUBLE_EQ(states.face.x.plus.Q.hu(0, 3), 0.1);
    EXPECT_DOUBLE_EQ(states.face.x.minus.U.u(0, 2), 0.1);
    EXPECT_EQ(states.U.u(0, 4), 0.0);
}

TEST_F(ShorelineStripTest, CorrectionCounts) {
    minmod_slope(states, grid, 1.3, 1e-10);
    get_discontinuous_cnsrv_q(states, grid);
    DepthCorrection stats = correct_negative_depth(states, grid, topo, 1e-10);

    EXPECT_EQ(stats.x_pairs, 2);
    EXPECT_EQ(stats.y_pairs, 1);
    EXPECT_EQ(stats.boundary, 3);
}

TEST_F(ShorelineStripTest, InputStateIsNotModified) {
    WHUHV before = states.Q;
    recon.reconstruct(states, grid, topo);

    for (int jj = 0; jj < grid.padded_rows(); ++jj) {
        for (int ii = 0; ii < grid.padded_cols(); ++ii) {
            EXPECT_EQ(states.Q.w(jj, ii), before.w(jj, ii));
            EXPECT_EQ(states.Q.hu(jj, ii), before.hu(jj, ii));
            EXPECT_EQ(states.Q.hv(jj, ii), before.hv(jj, ii));
        }
    }
}

TEST(ReconstructorTest, FlatFieldIsReproducedOnEveryFace) {
    Grid grid(6, 5);
    States states(grid);
    Topography topo = test::flat_topography(grid, 0.5);
    states.Q.w.fill(1.5);
    states.Q.hu.fill(0.25);
    states.Q.hv.fill(-0.125);

    minmod_slope(states, grid, 1.3, 1e-12);
    get_discontinuous_cnsrv_q(states, grid);
    DepthCorrection stats = correct_negative_depth(states, grid, topo, 1e-12);
    decompose_variables(states, grid, topo, 1e-4);

    EXPECT_EQ(stats.x_pairs + stats.y_pairs + stats.boundary, 0);
    for (const auto& view : test::all_faces(states, topo)) {
        const FaceState& f = *view.face;
        for (int j = 0; j < f.U.h.rows(); ++j) {
            for (int i = 0; i < f.U.h.cols(); ++i) {
                EXPECT_EQ(f.Q.w(j, i), 1.5) << view.name;
                EXPECT_EQ(f.Q.hu(j, i), 0.25) << view.name;
                EXPECT_EQ(f.Q.hv(j, i), -0.125) << view.name;
                EXPECT_EQ(f.U.h(j, i), 1.0) << view.name;
            }
        }
    }
}

TEST(ReconstructorTest, RandomInputsSatisfyFaceInvariants) {
    Grid grid(9, 7, 3);
    States states(grid);
    std::mt19937 rng(2021);
    Array2D vert(grid.ny + 1, grid.nx + 1);
    test::fill_random(vert, rng, -1.0, 1.0);
    Topography topo = Topography::from_vertices(grid, vert);
    test::fill_random(states.Q.w, rng, -1.0, 1.5);
    test::fill_random(states.Q.hu, rng, -3.0, 3.0);
    test::fill_random(states.Q.hv, rng, -3.0, 3.0);

    const Parameters params(1.7, 1e-4, 1e-12);
    MinmodReconstructor recon(params);
    recon.reconstruct(states, grid, topo);

    for (int j = 0; j < grid.ny; ++j) {
        for (int i = 0; i < grid.nx; ++i) {
            EXPECT_GE(states.U.h(j, i), 0.0);
        }
    }
    for (const auto& view : test::all_faces(states, topo)) {
        const FaceState& f = *view.face;
        const Array2D& b = *view.bed;
        for (int j = 0; j < f.U.h.rows(); ++j) {
            for (int i = 0; i < f.U.h.cols(); ++i) {
                const double h = f.U.h(j, i);
                EXPECT_GE(h, 0.0) << view.name;
                EXPECT_NEAR(f.Q.w(j, i) - b(j, i), h, 1e-12) << view.name;
                EXPECT_EQ(f.Q.hu(j, i), h * f.U.u(j, i)) << view.name;
                EXPECT_EQ(f.Q.hv(j, i), h * f.U.v(j, i)) << view.name;
                if (h < params.drytol) {
                    EXPECT_EQ(f.U.u(j, i), 0.0) << view.name;
                    EXPECT_EQ(f.U.v(j, i), 0.0) << view.name;
                }
            }
        }
    }
}

TEST(ReconstructorTest, PiecewiseConstantCopiesNeighborCenters) {
    Grid grid(4, 3);
    States states(grid);
    Topography topo = test::flat_topography(grid);
    std::mt19937 rng(5);
    test::fill_random(states.Q.w, rng, 0.5, 1.5);

    PiecewiseConstantReconstructor recon;
    recon.reconstruct(states, grid, topo);

    const int ngh = grid.ngh;
    for (int j = 0; j < grid.ny; ++j) {
        for (int f = 0; f < grid.nx + 1; ++f) {
            EXPECT_EQ(states.face.x.minus.Q.w(j, f), states.Q.w(ngh + j, ngh - 1 + f));
            EXPECT_EQ(states.face.x.plus.Q.w(j, f), states.Q.w(ngh + j, ngh + f));
        }
    }
    for (int f = 0; f < grid.ny + 1; ++f) {
        for (int i = 0; i < grid.nx; ++i) {
            EXPECT_EQ(states.face.y.minus.Q.w(f, i), states.Q.w(ngh - 1 + f, ngh + i));
            EXPECT_EQ(states.face.y.plus.Q.w(f, i), states.Q.w(ngh + f, ngh + i));
        }
    }
}

TEST(ReconstructorTest, ShapeMismatchThrowsBeforeWriting) {
    Grid grid(4, 3);
    States states(grid);
    states.face.x.minus.Q.w.fill(42.0);
    Topography other = test::flat_topography(Grid(5, 3));

    std::shared_ptr<Reconstructor> recon = std::make_shared<MinmodReconstructor>();
    EXPECT_THROW(recon->reconstruct(states, grid, other), std::invalid_argument);
    EXPECT_EQ(states.face.x.minus.Q.w(1, 1), 42.0);

    states.U.h = Array2D(3, 5);
    EXPECT_THROW(recon->reconstruct(states, grid, test::flat_topography(grid)), std::invalid_argument);
    EXPECT_EQ(states.face.x.minus.Q.w(1, 1), 42.0);
}

TEST(ReconstructorTest, RejectsOutOfRangeParameters) {
    EXPECT_THROW((void)MinmodReconstructor(Parameters(2.5, 1e-4, 1e-12)), std::invalid_argument);
    EXPECT_THROW((void)PiecewiseConstantReconstructor(Parameters(1.3, -1.0, 1e-12)), std::invalid_argument);

    MinmodReconstructor recon(Parameters(1.0, 1e-3, 1e-10));
    EXPECT_EQ(recon.params().theta, 1.0);
    EXPECT_EQ(recon.params().drytol, 1e-3);
}

class StageShapeTest : public ::testing::Test {
protected:
    Grid grid{4, 3};
    Grid larger{40, 30};
    States states{grid};
    Topography topo = test::flat_topography(grid);

    void SetUp() override {
        states.slp.x.w.fill(42.0);
        states.face.x.minus.Q.w.fill(42.0);
        states.U.h.fill(42.0);
        states.face.y.plus.U.u.fill(42.0);
    }
};

TEST_F(StageShapeTest, MinmodSlopeThrowsOnMismatchedGrid) {
    EXPECT_THROW(minmod_slope(states, larger, 1.3, 1e-12), std::invalid_argument);
    EXPECT_EQ(states.slp.x.w(0, 0), 42.0);
}

TEST_F(StageShapeTest, FaceExtrapolationThrowsOnMismatchedGrid) {
    EXPECT_THROW(get_discontinuous_cnsrv_q(states, larger), std::invalid_argument);
    EXPECT_EQ(states.face.x.minus.Q.w(0, 0), 42.0);
}

TEST_F(StageShapeTest, DepthCorrectionThrowsOnMismatchedGrid) {
    EXPECT_THROW(correct_negative_depth(states, larger, topo, 1e-12), std::invalid_argument);
    EXPECT_THROW(correct_negative_depth(states, grid, test::flat_topography(larger), 1e-12),
                 std::invalid_argument);
    EXPECT_EQ(states.U.h(0, 0), 42.0);
}

TEST_F(StageShapeTest, DecomposeThrowsOnMismatchedGrid) {
    EXPECT_THROW(decompose_variables(states, larger, topo, 1e-4), std::invalid_argument);
    EXPECT_THROW(decompose_variables(states, grid, test::flat_topography(larger), 1e-4),
                 std::invalid_argument);
    EXPECT_EQ(states.face.y.plus.U.u(0, 0), 42.0);
}
