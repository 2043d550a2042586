/*
 Copyright 2025 Tomo Sasaki

 Licensed under the Apache License, Version 2.0 (the "License");
 you may not use this file except in compliance with the License.
 You may obtain a copy of the License at

      https://www.apache.org/licenses/LICENSE-2.0

 Unless required by applicable law or agreed to in writing, software
 distributed under the License is distributed on an "AS IS" BASIS,
 WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 See the License for the specific language governing permissions and
 limitations under the License.
*/
// Description: Tests for the path constraint classes in mstage-cpp.
#include <cmath>
#include <limits>
#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "mstage_core/constraint.hpp"
#include "mstage_core/helper.hpp"

using namespace mstage;

namespace {
// Evaluates evaluateSymbolic through a casadi::Function
Eigen::VectorXd evaluateThroughCasadi(const Constraint& constraint,
                                      const Eigen::VectorXd& state,
                                      const Eigen::VectorXd& control) {
    casadi::MX x = casadi::MX::sym("x", state.size());
    casadi::MX u = casadi::MX::sym("u", control.size());
    casadi::Function g("g", std::vector<casadi::MX>{x, u},
                       std::vector<casadi::MX>{constraint.evaluateSymbolic(x, u)});
    std::vector<casadi::DM> out = g(std::vector<casadi::DM>{helper::toDM(state), helper::toDM(control)});
    return helper::toEigen(out[0]);
}

std::shared_ptr<const TruckTrailer> testVehicle() {
    VehicleParameters parameters;
    parameters.truck = {0.3375, 0.06, 0.2};
    parameters.trailer = {0.3, 0.06, 0.2};
    return std::make_shared<TruckTrailer>(parameters);
}

// |x| <= 0.5, y <= 2.4
Eigen::MatrixXd verticalCorridor() {
    Eigen::MatrixXd planes(3, 3);
    planes << -1.0, 1.0, 0.0,
               0.0, 0.0, 1.0,
              -0.5, -0.5, -2.4;
    return planes;
}
} // namespace

TEST(ControlBoxConstraintTest, Evaluate) {
    Eigen::VectorXd lower_bound(2);
    lower_bound << -M_PI / 6, -0.2;
    Eigen::VectorXd upper_bound(2);
    upper_bound << M_PI / 6, 0.2;
    ControlBoxConstraint constraint(lower_bound, upper_bound);
    ASSERT_EQ(constraint.getDim(), 2);

    Eigen::VectorXd state = Eigen::VectorXd::Zero(4);
    Eigen::VectorXd control(2);
    control << 0.1, 0.1;
    ASSERT_TRUE(constraint.evaluate(state, control).isApprox(control));
    EXPECT_DOUBLE_EQ(constraint.computeViolation(state, control), 0.0);

    // Outside the bounds
    control << 1.0, -0.5;
    EXPECT_NEAR(constraint.computeViolation(state, control), (1.0 - M_PI / 6) + 0.3, 1e-12);

    EXPECT_TRUE(evaluateThroughCasadi(constraint, state, control).isApprox(control));

    Eigen::VectorXd short_bound(1);
    short_bound << 1.0;
    EXPECT_THROW(ControlBoxConstraint(lower_bound, short_bound), std::invalid_argument);
}

TEST(LinearConstraintTest, Articulation) {
    // beta01 = theta0 - theta1
    Eigen::MatrixXd A(1, 4);
    A << -1.0, 0.0, 0.0, 1.0;
    Eigen::VectorXd bound = Eigen::VectorXd::Constant(1, M_PI / 2);
    LinearConstraint constraint(A, -bound, bound);

    Eigen::VectorXd state(4);
    state << 0.2, 3.0, -1.0, 1.0;
    Eigen::VectorXd control = Eigen::VectorXd::Zero(2);

    Eigen::VectorXd g = constraint.evaluate(state, control);
    ASSERT_EQ(g.size(), 1);
    EXPECT_NEAR(g(0), 0.8, 1e-12);
    EXPECT_NEAR(evaluateThroughCasadi(constraint, state, control)(0), 0.8, 1e-12);
    EXPECT_DOUBLE_EQ(constraint.computeViolation(state, control), 0.0);

    state(3) = 2.0;
    EXPECT_NEAR(constraint.computeViolation(state, control), 1.8 - M_PI / 2, 1e-12);

    // Upper bound only
    LinearConstraint upper_only(A, bound);
    EXPECT_TRUE(std::isinf(upper_only.getLowerBound()(0)));
}

TEST(CorridorConstraintTest, InsideAndOutside) {
    auto model = testVehicle();
    CorridorConstraint trailer(model, TruckTrailer::Body::Trailer, verticalCorridor());
    CorridorConstraint truck(model, TruckTrailer::Body::Truck, verticalCorridor());
    ASSERT_EQ(trailer.getDim(), 12);

    // Heading up the corridor from the origin
    Eigen::VectorXd state(4);
    state << M_PI / 2, 0.0, 0.0, M_PI / 2;
    Eigen::VectorXd control = Eigen::VectorXd::Zero(2);

    EXPECT_LE(trailer.evaluate(state, control).maxCoeff(), 0.0);
    EXPECT_LE(truck.evaluate(state, control).maxCoeff(), 0.0);
    EXPECT_DOUBLE_EQ(trailer.computeViolation(state, control), 0.0);

    // Two trailer corners cross the right wall by 0.05
    state(TruckTrailer::STATE_X1) = 0.45;
    EXPECT_NEAR(trailer.computeViolation(state, control), 0.1, 1e-9);
    EXPECT_NEAR(truck.computeViolation(state, control), 0.1, 1e-9);

    // Corner-major layout: front-right corner against the right wall
    Eigen::VectorXd g = trailer.evaluate(state, control);
    EXPECT_NEAR(g(1 * 3 + 1), 0.05, 1e-9);
}

TEST(CorridorConstraintTest, Symbolic) {
    auto model = testVehicle();
    CorridorConstraint constraint(model, TruckTrailer::Body::Truck, verticalCorridor());

    Eigen::VectorXd state(4);
    state << 1.2, 0.1, 1.5, 1.6;
    Eigen::VectorXd control(2);
    control << 0.1, 0.1;

    Eigen::VectorXd g = constraint.evaluate(state, control);
    EXPECT_TRUE(evaluateThroughCasadi(constraint, state, control).isApprox(g, 1e-12));

    // Shifting the truck sideways moves each plane row by its normal's x component
    Eigen::VectorXd shifted = state;
    shifted(TruckTrailer::STATE_X1) += 0.01;
    Eigen::VectorXd dg = constraint.evaluate(shifted, control) - g;
    for (int i = 0; i < 4; ++i) {
        EXPECT_NEAR(dg(3 * i + 0), -0.01, 1e-9);
        EXPECT_NEAR(dg(3 * i + 1), 0.01, 1e-9);
        EXPECT_NEAR(dg(3 * i + 2), 0.0, 1e-9);
    }

    EXPECT_THROW(CorridorConstraint(model, TruckTrailer::Body::Truck, Eigen::MatrixXd::Zero(2, 3)),
                 std::invalid_argument);
}
