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
#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "mstage_core/stage.hpp"

namespace mstage
{

using casadi::MX;
using casadi::Slice;

Stage::Stage(casadi::Opti &opti,
             const std::string &name,
             std::shared_ptr<const DynamicalSystem> model,
             const StageOptions &options)
    : opti_(opti), name_(name), model_(std::move(model)), options_(options)
{
    if (!model_)
    {
        throw std::invalid_argument("Stage '" + name_ + "': dynamical system must not be null");
    }
    if (options_.num_intervals < 1 || options_.num_substeps < 1)
    {
        throw std::invalid_argument("Stage '" + name_ + "': num_intervals and num_substeps must be positive");
    }

    nx_ = model_->getStateDim();
    nu_ = model_->getControlDim();
    const int N = options_.num_intervals;

    // Primitive symbols, so that expressions built from their slices remain
    // valid Function inputs
    xa_sym_ = MX::sym(name_ + "_x", nx_ + nu_);
    ua_sym_ = MX::sym(name_ + "_du", nu_);
    state_ = xa_sym_(Slice(0, nx_));
    control_ = xa_sym_(Slice(nx_, nx_ + nu_));

    // Free time
    t0_ = opti_.variable();
    T_ = opti_.variable();
    opti_.set_initial(t0_, options_.t0_guess);
    opti_.set_initial(T_, options_.duration_guess);
    opti_.subject_to(T_ >= 0.0);

    X_ = opti_.variable(nx_ + nu_, N + 1);
    U_ = opti_.variable(nu_, N);

    // Augmented dynamics on normalized time s in [0, 1]: d x_aug / ds = h [f(x, u); du]
    const MX h = MX::sym("h");
    const MX f = model_->getContinuousDynamicsSymbolic(state_, control_);
    if (f.size1() != nx_)
    {
        throw std::invalid_argument("Stage '" + name_ + "': symbolic dynamics has wrong dimension");
    }
    casadi::MXDict dae = {{"x", xa_sym_},
                          {"p", MX::vertcat({ua_sym_, h})},
                          {"ode", h * MX::vertcat({f, ua_sym_})}};
    casadi::Dict integrator_opts = {{"number_of_finite_elements", options_.num_substeps},
                                    {"simplify", true}};
    integrator_ = casadi::integrator(name_ + "_integrator", options_.integrator, dae,
                                     0.0, 1.0, integrator_opts);

    // Multiple shooting
    const MX dt = T_ / N;
    casadi::Function shooting = integrator_.map(N);
    const MX P = MX::vertcat({U_, MX::repmat(dt, 1, N)});
    const MX X_next = shooting(casadi::MXDict{{"x0", X_(Slice(), Slice(0, N))}, {"p", P}}).at("xf");
    opti_.subject_to(X_(Slice(), Slice(1, N + 1)) == X_next);

    objective_ = MX(0.0);
}

MX Stage::evaluateAtNode(const MX &expr, int node) const
{
    casadi::Function f(name_ + "_at_node", std::vector<MX>{xa_sym_, ua_sym_}, std::vector<MX>{expr});
    const int interval = std::min(node, options_.num_intervals - 1);
    return f(std::vector<MX>{X_(Slice(), node), U_(Slice(), interval)})[0];
}

MX Stage::atT0(const MX &expr) const
{
    return evaluateAtNode(expr, 0);
}

MX Stage::atTf(const MX &expr) const
{
    return evaluateAtNode(expr, options_.num_intervals);
}

void Stage::addBoundedRows(const MX &G,
                           const Eigen::VectorXd &lower_bound,
                           const Eigen::VectorXd &upper_bound)
{
    for (int i = 0; i < G.size1(); ++i)
    {
        const double lb = lower_bound(i);
        const double ub = upper_bound(i);
        const bool has_lower = std::isfinite(lb);
        const bool has_upper = std::isfinite(ub);
        const MX row = G(i, Slice());

        if (has_lower && has_upper)
        {
            if (lb == ub)
            {
                opti_.subject_to(row == lb);
            }
            else
            {
                opti_.subject_to(opti_.bounded(lb, row, ub));
            }
        }
        else if (has_lower)
        {
            opti_.subject_to(row >= lb);
        }
        else if (has_upper)
        {
            opti_.subject_to(row <= ub);
        }
    }
}

void Stage::addPathConstraint(std::string constraint_name,
                              std::unique_ptr<Constraint> constraint)
{
    if (!constraint)
    {
        throw std::invalid_argument("Stage '" + name_ + "': constraint '" + constraint_name + "' is null");
    }
    if (path_constraint_set_.count(constraint_name) > 0)
    {
        throw std::invalid_argument("Stage '" + name_ + "': duplicate path constraint '" + constraint_name + "'");
    }

    const MX g = constraint->evaluateSymbolic(state_, control_);
    if (g.size1() != constraint->getDim())
    {
        throw std::invalid_argument("Stage '" + name_ + "': constraint '" + constraint_name +
                                    "' evaluates to " + std::to_string(g.size1()) + " rows, expected " +
                                    std::to_string(constraint->getDim()));
    }

    // Vectorized over all nodes: rows of G are constraint rows, columns are nodes
    casadi::Function g_fun(name_ + "_" + constraint_name, std::vector<MX>{xa_sym_}, std::vector<MX>{g});
    const MX G = g_fun.map(options_.num_intervals + 1)(std::vector<MX>{X_})[0];
    addBoundedRows(G, constraint->getLowerBound(), constraint->getUpperBound());

    path_constraint_set_[constraint_name] = std::move(constraint);
}

void Stage::addRateConstraint(std::string constraint_name,
                              std::unique_ptr<Constraint> constraint)
{
    if (!constraint)
    {
        throw std::invalid_argument("Stage '" + name_ + "': constraint '" + constraint_name + "' is null");
    }
    if (rate_constraint_set_.count(constraint_name) > 0)
    {
        throw std::invalid_argument("Stage '" + name_ + "': duplicate rate constraint '" + constraint_name + "'");
    }

    const MX g = constraint->evaluateSymbolic(state_, ua_sym_);
    if (g.size1() != constraint->getDim())
    {
        throw std::invalid_argument("Stage '" + name_ + "': constraint '" + constraint_name +
                                    "' evaluates to " + std::to_string(g.size1()) + " rows, expected " +
                                    std::to_string(constraint->getDim()));
    }

    const int N = options_.num_intervals;
    casadi::Function g_fun(name_ + "_" + constraint_name, std::vector<MX>{xa_sym_, ua_sym_}, std::vector<MX>{g});
    const MX G = g_fun.map(N)(std::vector<MX>{X_(Slice(), Slice(0, N)), U_})[0];
    addBoundedRows(G, constraint->getLowerBound(), constraint->getUpperBound());

    rate_constraint_set_[constraint_name] = std::move(constraint);
}

void Stage::addObjective(const MX &term)
{
    objective_ += term;
}

casadi::Function Stage::signalFunction(const std::string &name,
                                       const std::vector<MX> &signals) const
{
    return casadi::Function(name, std::vector<MX>{xa_sym_, ua_sym_}, signals);
}

} // namespace mstage
