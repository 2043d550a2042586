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
#ifndef MSTAGE_STAGE_HPP
#define MSTAGE_STAGE_HPP

#include <casadi/casadi.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "mstage_core/constraint.hpp"
#include "mstage_core/dynamical_system.hpp"
#include "mstage_core/options.hpp"

namespace mstage
{
    /**
     * @brief One phase of a multi-stage optimal control problem.
     *
     * A stage owns a free start time t0, a free duration T and the multiple
     * shooting variables of its interval [t0, t0 + T]. Model controls are
     * first order: they are appended to the model state, giving the augmented
     * state x_aug = [x; u], and their rates du are the decision controls.
     *
     * Variables:
     * - X: x_aug at the N + 1 shooting nodes
     * - U: du on the N shooting intervals
     *
     * Every interval is integrated with a fixed-step CasADi integrator using M
     * substeps, and the next node is constrained to the integrator output.
     */
    class Stage
    {
    public:
        Stage(casadi::Opti &opti,
              const std::string &name,
              std::shared_ptr<const DynamicalSystem> model,
              const StageOptions &options = StageOptions());

        // Non-copyable: holds symbols tied to one Opti instance
        Stage(const Stage &) = delete;
        Stage &operator=(const Stage &) = delete;

        const std::string &getName() const { return name_; }
        const StageOptions &getOptions() const { return options_; }
        const DynamicalSystem &getSystem() const { return *model_; }
        int getNumIntervals() const { return options_.num_intervals; }
        int getStateDim() const { return nx_; }
        int getControlDim() const { return nu_; }
        int getAugmentedStateDim() const { return nx_ + nu_; }

        // --- Symbols usable in signal and boundary expressions ---
        const casadi::MX &augmentedState() const { return xa_sym_; }
        const casadi::MX &state() const { return state_; }
        const casadi::MX &control() const { return control_; }
        const casadi::MX &controlRate() const { return ua_sym_; }

        // --- Time decision variables ---
        const casadi::MX &t0() const { return t0_; }
        const casadi::MX &T() const { return T_; }
        casadi::MX tf() const { return t0_ + T_; }

        // --- Node decision variables ---
        const casadi::MX &X() const { return X_; }
        const casadi::MX &U() const { return U_; }

        /**
         * @brief Evaluates an expression of the stage symbols at the first node
         * @param expr Expression in augmentedState(), state(), control(), controlRate()
         */
        casadi::MX atT0(const casadi::MX &expr) const;

        /**
         * @brief Evaluates an expression of the stage symbols at the last node
         *
         * The rate symbols take the value of the last interval.
         */
        casadi::MX atTf(const casadi::MX &expr) const;

        /**
         * @brief Enforces lb <= g(x, u) <= ub at every shooting node
         *
         * The constraint sees the model state and the model control, both part
         * of the augmented state. Rows with two infinite bounds are skipped.
         */
        void addPathConstraint(std::string constraint_name,
                               std::unique_ptr<Constraint> constraint);

        /**
         * @brief Enforces lb <= g(x, du) <= ub on every shooting interval
         *
         * The constraint sees the model state and the control rates.
         */
        void addRateConstraint(std::string constraint_name,
                               std::unique_ptr<Constraint> constraint);

        // Adds a term to the stage objective
        void addObjective(const casadi::MX &term);
        const casadi::MX &getObjective() const { return objective_; }

        template <typename T>
        T *getConstraint(const std::string &name) const
        {
            auto it = path_constraint_set_.find(name);
            if (it == path_constraint_set_.end())
                return nullptr;
            return dynamic_cast<T *>(it->second.get());
        }

        const std::map<std::string, std::unique_ptr<Constraint>> &getConstraintSet() const { return path_constraint_set_; }
        const std::map<std::string, std::unique_ptr<Constraint>> &getRateConstraintSet() const { return rate_constraint_set_; }

        // Fixed-step integrator over one (partial) interval:
        // x0 = x_aug, p = [du; h] -> xf = x_aug(h)
        const casadi::Function &getIntegrator() const { return integrator_; }

        // Function (x_aug, du) -> signals, for numeric evaluation of expressions
        casadi::Function signalFunction(const std::string &name,
                                        const std::vector<casadi::MX> &signals) const;

    private:
        casadi::MX evaluateAtNode(const casadi::MX &expr, int node) const;

        // Adds lb <= G(i, :) <= ub row by row, skipping free rows
        void addBoundedRows(const casadi::MX &G,
                            const Eigen::VectorXd &lower_bound,
                            const Eigen::VectorXd &upper_bound);

        casadi::Opti &opti_;
        std::string name_;
        std::shared_ptr<const DynamicalSystem> model_;
        StageOptions options_;
        int nx_;
        int nu_;

        casadi::MX xa_sym_;  // primitive augmented-state symbol
        casadi::MX ua_sym_;  // primitive control-rate symbol
        casadi::MX state_;   // slice of xa_sym_
        casadi::MX control_; // slice of xa_sym_

        casadi::MX t0_;
        casadi::MX T_;
        casadi::MX X_;
        casadi::MX U_;
        casadi::MX objective_;

        casadi::Function integrator_;

        std::map<std::string, std::unique_ptr<Constraint>> path_constraint_set_;
        std::map<std::string, std::unique_ptr<Constraint>> rate_constraint_set_;
    };

} // namespace mstage

#endif // MSTAGE_STAGE_HPP
