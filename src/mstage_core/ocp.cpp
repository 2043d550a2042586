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
#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#include "mstage_core/helper.hpp"
#include "mstage_core/ocp.hpp"

namespace mstage
{

using casadi::DM;
using casadi::MX;

Eigen::MatrixXd StageGuess::fromRows(const std::vector<Eigen::VectorXd> &rows, int cols)
{
    Eigen::MatrixXd guess(rows.size(), cols);
    for (size_t i = 0; i < rows.size(); ++i)
    {
        if (rows[i].size() == 1)
        {
            guess.row(i).setConstant(rows[i](0));
        }
        else if (rows[i].size() == cols)
        {
            guess.row(i) = rows[i].transpose();
        }
        else
        {
            throw std::invalid_argument("StageGuess::fromRows: row " + std::to_string(i) + " has " +
                                        std::to_string(rows[i].size()) + " entries, expected 1 or " +
                                        std::to_string(cols));
        }
    }
    return guess;
}

// --- SolveFunction ---

SolveFunction::SolveFunction(casadi::Function function,
                             std::vector<std::string> stage_names)
    : function_(std::move(function)), stage_names_(std::move(stage_names))
{
}

SolveResult SolveFunction::operator()(const std::vector<StageGuess> &guesses) const
{
    const int num_stages = getNumStages();
    if (static_cast<int>(guesses.size()) != num_stages)
    {
        throw std::invalid_argument("SolveFunction: expected " + std::to_string(num_stages) +
                                    " stage guesses, got " + std::to_string(guesses.size()));
    }

    // Inputs per stage: T, X, U
    std::vector<DM> args;
    for (int i = 0; i < num_stages; ++i)
    {
        const StageGuess &guess = guesses[i];
        const int ix = 3 * i + 1;
        const int iu = 3 * i + 2;
        if (guess.states.rows() != function_.size1_in(ix) || guess.states.cols() != function_.size2_in(ix))
        {
            throw std::invalid_argument("SolveFunction: state guess of stage '" + stage_names_[i] +
                                        "' must be " + std::to_string(function_.size1_in(ix)) + " x " +
                                        std::to_string(function_.size2_in(ix)));
        }
        if (guess.controls.rows() != function_.size1_in(iu) || guess.controls.cols() != function_.size2_in(iu))
        {
            throw std::invalid_argument("SolveFunction: control guess of stage '" + stage_names_[i] +
                                        "' must be " + std::to_string(function_.size1_in(iu)) + " x " +
                                        std::to_string(function_.size2_in(iu)));
        }
        args.push_back(DM(guess.duration));
        args.push_back(helper::toDM(guess.states));
        args.push_back(helper::toDM(guess.controls));
    }

    auto start_time = std::chrono::high_resolution_clock::now();
    const std::vector<DM> res = function_(args);
    auto end_time = std::chrono::high_resolution_clock::now();

    // Outputs per stage: t0, T, X, U, followed by the objective
    SolveResult result;
    for (int i = 0; i < num_stages; ++i)
    {
        StageSolution stage;
        stage.name = stage_names_[i];
        stage.t0 = res[4 * i].scalar();
        stage.T = res[4 * i + 1].scalar();
        stage.states = helper::toEigen(res[4 * i + 2]);
        stage.controls = helper::toEigen(res[4 * i + 3]);
        result.stages.push_back(stage);
    }
    result.objective = res.back().scalar();
    result.solve_time_ms =
        std::chrono::duration<double, std::milli>(end_time - start_time).count();
    result.gist.stages_ = result.stages;
    return result;
}

// --- MultiStageOCP ---

MultiStageOCP::MultiStageOCP(const SolverOptions &options)
    : options_(options)
{
}

Stage &MultiStageOCP::addStage(const std::string &name,
                               std::shared_ptr<const DynamicalSystem> model,
                               const StageOptions &options)
{
    for (const auto &stage : stages_)
    {
        if (stage->getName() == name)
        {
            throw std::invalid_argument("MultiStageOCP: duplicate stage name '" + name + "'");
        }
    }
    stages_.push_back(std::make_unique<Stage>(opti_, name, std::move(model), options));
    return *stages_.back();
}

Stage &MultiStageOCP::getStage(const std::string &name) const
{
    for (const auto &stage : stages_)
    {
        if (stage->getName() == name)
        {
            return *stage;
        }
    }
    throw std::invalid_argument("MultiStageOCP: no stage named '" + name + "'");
}

int MultiStageOCP::stageIndex(const Stage &stage) const
{
    for (size_t i = 0; i < stages_.size(); ++i)
    {
        if (stages_[i].get() == &stage)
        {
            return static_cast<int>(i);
        }
    }
    throw std::invalid_argument("MultiStageOCP: stage '" + stage.getName() + "' belongs to another problem");
}

void MultiStageOCP::stitch(const Stage &first, const Stage &second)
{
    stageIndex(first);
    stageIndex(second);
    if (first.getAugmentedStateDim() != second.getAugmentedStateDim())
    {
        throw std::invalid_argument("MultiStageOCP: cannot stitch stages '" + first.getName() + "' and '" +
                                    second.getName() + "' with different state dimensions");
    }

    // Stitch time
    opti_.subject_to(first.tf() == second.t0());
    // Stitch states, model controls included
    opti_.subject_to(second.atT0(second.augmentedState()) == first.atTf(first.augmentedState()));
}

void MultiStageOCP::subjectTo(const MX &constraint)
{
    opti_.subject_to(constraint);
}

SolveFunction MultiStageOCP::toFunction(const std::string &name)
{
    if (stages_.empty())
    {
        throw std::logic_error("MultiStageOCP: cannot compile a problem without stages");
    }

    MX objective = MX(0.0);
    for (const auto &stage : stages_)
    {
        objective += stage->getObjective();
    }
    opti_.minimize(objective);

    const casadi::Dict solver_opts =
        options_.plugin == "ipopt" ? ipoptOptions(options_) : casadi::Dict();
    opti_.solver(options_.plugin, pluginOptions(options_), solver_opts);

    std::vector<MX> inputs;
    std::vector<MX> outputs;
    std::vector<std::string> input_names;
    std::vector<std::string> output_names;
    std::vector<std::string> stage_names;
    for (const auto &stage : stages_)
    {
        const std::string &s = stage->getName();
        stage_names.push_back(s);

        // Decision variables as inputs act as initial guesses
        inputs.insert(inputs.end(), {stage->T(), stage->X(), stage->U()});
        input_names.insert(input_names.end(), {s + "_T_guess", s + "_X_guess", s + "_U_guess"});

        outputs.insert(outputs.end(), {stage->t0(), stage->T(), stage->X(), stage->U()});
        output_names.insert(output_names.end(), {s + "_t0", s + "_T", s + "_X", s + "_U"});
    }
    outputs.push_back(opti_.f());
    output_names.push_back("objective");

    if (options_.verbose)
    {
        printOptions(options_);
        for (const auto &stage : stages_)
        {
            printOptions(stage->getName(), stage->getOptions());
        }
    }

    casadi::Function function = opti_.to_function(name, inputs, outputs, input_names, output_names);
    return SolveFunction(function, stage_names);
}

void printSolutionSummary(const SolveResult &result)
{
    std::cout << "\n========================================\n";
    std::cout << "       Multi-Stage Solution Summary\n";
    std::cout << "========================================\n";

    std::cout << "Objective: " << std::setprecision(6) << result.objective << "\n";
    std::cout << "Solve Time: " << std::setprecision(4) << result.solve_time_ms << " ms\n";
    for (const auto &stage : result.stages)
    {
        std::cout << "--- Stage '" << stage.name << "' ---\n";
        std::cout << "  t0: " << std::setw(10) << stage.t0 << "\n";
        std::cout << "  T:  " << std::setw(10) << stage.T << "\n";
        std::cout << "  tf: " << std::setw(10) << stage.tf() << "\n";
        std::cout << "  Nodes: " << std::setw(7) << stage.states.cols() << "\n";
    }
    std::cout << "========================================\n\n";
}

} // namespace mstage
