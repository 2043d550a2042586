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

#ifndef MSTAGE_CONSTRAINT_HPP
#define MSTAGE_CONSTRAINT_HPP

#include <Eigen/Dense>
#include <casadi/casadi.hpp>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include "dynamics_model/truck_trailer.hpp"

namespace mstage
{

  // Constraint of the form lb <= g(x, u) <= ub, evaluated numerically or on
  // CasADi symbols. Infinite bounds mark one-sided rows.
  class Constraint
  {
  public:
    // Constructor
    Constraint(const std::string &name) : name_(name) {}

    virtual ~Constraint() = default;

    // Get the name of the constraint
    const std::string &getName() const { return name_; }

    // Number of rows of g
    virtual int getDim() const = 0;

    // Evaluate the constraint function: g(x, u)
    virtual Eigen::VectorXd evaluate(const Eigen::VectorXd &state,
                                     const Eigen::VectorXd &control) const = 0;

    // Evaluate the constraint function on symbols: g(x, u)
    virtual casadi::MX evaluateSymbolic(const casadi::MX &state,
                                        const casadi::MX &control) const = 0;

    // Get the lower bound of the constraint
    virtual Eigen::VectorXd getLowerBound() const = 0;

    // Get the upper bound of the constraint
    virtual Eigen::VectorXd getUpperBound() const = 0;

    // Compute how far the constraint is violated
    double computeViolation(const Eigen::VectorXd &state,
                            const Eigen::VectorXd &control) const
    {
      return computeViolationFromValue(evaluate(state, control));
    }

    // Given g(x,u), sum of amounts above the upper or below the lower bound
    double computeViolationFromValue(const Eigen::VectorXd &g) const
    {
      return (g - getUpperBound()).cwiseMax(0.0).sum() +
             (getLowerBound() - g).cwiseMax(0.0).sum();
    }

  private:
    std::string name_; // Name of the constraint
  };

  //------------------------------------------------------------------------------

  class ControlBoxConstraint : public Constraint
  {
  public:
    ControlBoxConstraint(const Eigen::VectorXd &lower_bound,
                         const Eigen::VectorXd &upper_bound)
        : Constraint("ControlBoxConstraint"), lower_bound_(lower_bound),
          upper_bound_(upper_bound)
    {
      if (lower_bound_.size() != upper_bound_.size())
      {
        throw std::invalid_argument("ControlBoxConstraint: bound sizes differ");
      }
    }

    int getDim() const override { return lower_bound_.size(); }

    Eigen::VectorXd evaluate(const Eigen::VectorXd &state,
                             const Eigen::VectorXd &control) const override
    {
      return control;
    }

    casadi::MX evaluateSymbolic(const casadi::MX &state,
                                const casadi::MX &control) const override
    {
      return control;
    }

    Eigen::VectorXd getLowerBound() const override { return lower_bound_; }

    Eigen::VectorXd getUpperBound() const override { return upper_bound_; }

  private:
    Eigen::VectorXd lower_bound_;
    Eigen::VectorXd upper_bound_;
  };

  // lb <= A x <= ub
  class LinearConstraint : public Constraint
  {
  public:
    LinearConstraint(const Eigen::MatrixXd &A, const Eigen::VectorXd &b)
        : LinearConstraint(A,
                           Eigen::VectorXd::Constant(
                               b.size(), -std::numeric_limits<double>::infinity()),
                           b) {}

    LinearConstraint(const Eigen::MatrixXd &A, const Eigen::VectorXd &lower_bound,
                     const Eigen::VectorXd &upper_bound)
        : Constraint("LinearConstraint"), A_(A), lower_bound_(lower_bound),
          upper_bound_(upper_bound)
    {
      if (A_.rows() != lower_bound_.size() || A_.rows() != upper_bound_.size())
      {
        throw std::invalid_argument(
            "LinearConstraint: A rows must match the bound sizes");
      }
    }

    int getDim() const override { return A_.rows(); }

    Eigen::VectorXd evaluate(const Eigen::VectorXd &state,
                             const Eigen::VectorXd &control) const override
    {
      return A_ * state;
    }

    casadi::MX evaluateSymbolic(const casadi::MX &state,
                                const casadi::MX &control) const override;

    Eigen::VectorXd getLowerBound() const override { return lower_bound_; }

    Eigen::VectorXd getUpperBound() const override { return upper_bound_; }

  private:
    Eigen::MatrixXd A_;
    Eigen::VectorXd lower_bound_;
    Eigen::VectorXd upper_bound_;
  };

  /**
   * @brief Keeps one body of a truck-trailer inside a polygonal corridor
   *
   * Each column w = [n; c] of the plane matrix is a half-plane n.p + c <= 0.
   * Every footprint corner must satisfy every half-plane, giving 4 x P rows
   * ordered corner-major.
   */
  class CorridorConstraint : public Constraint
  {
  public:
    CorridorConstraint(std::shared_ptr<const TruckTrailer> model,
                       TruckTrailer::Body body,
                       const Eigen::MatrixXd &planes);

    int getDim() const override { return 4 * planes_.cols(); }

    Eigen::VectorXd evaluate(const Eigen::VectorXd &state,
                             const Eigen::VectorXd &control) const override;

    casadi::MX evaluateSymbolic(const casadi::MX &state,
                                const casadi::MX &control) const override;

    Eigen::VectorXd getLowerBound() const override
    {
      return Eigen::VectorXd::Constant(getDim(),
                                       -std::numeric_limits<double>::infinity());
    }

    Eigen::VectorXd getUpperBound() const override
    {
      return Eigen::VectorXd::Zero(getDim());
    }

    TruckTrailer::Body getBody() const { return body_; }
    const Eigen::MatrixXd &getPlanes() const { return planes_; }

  private:
    std::shared_ptr<const TruckTrailer> model_;
    TruckTrailer::Body body_;
    Eigen::MatrixXd planes_; // 3 x P
  };

} // namespace mstage
#endif // MSTAGE_CONSTRAINT_HPP
