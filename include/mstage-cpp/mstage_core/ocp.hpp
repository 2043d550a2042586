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
#ifndef MSTAGE_OCP_HPP
#define MSTAGE_OCP_HPP

#include <Eigen/Dense>
#include <casadi/casadi.hpp>
#include <memory>
#include <string>
#include <vector>

#include "mstage_core/options.hpp"
#include "mstage_core/stage.hpp"

namespace mstage
{
    /**
     * @brief Initial guess handed to a solve function for one stage
     */
    struct StageGuess
    {
        double duration = 10.0;   ///< Guess of T.
        Eigen::MatrixXd states;   ///< x_aug guess, (nx + nu) x (N + 1).
        Eigen::MatrixXd controls; ///< du guess, nu x N.

        /**
         * @brief Stacks per-signal rows into a guess matrix
         *
         * A row of length 1 is repeated over all columns, any other row must
         * have exactly @p cols entries (e.g. a helper::linspace).
         */
        static Eigen::MatrixXd fromRows(const std::vector<Eigen::VectorXd> &rows, int cols);
    };

    /**
     * @brief Optimized values of one stage
     */
    struct StageSolution
    {
        std::string name;
        double t0 = 0.0;
        double T = 0.0;
        Eigen::MatrixXd states;   ///< x_aug at the nodes, (nx + nu) x (N + 1).
        Eigen::MatrixXd controls; ///< du on the intervals, nu x N.

        double tf() const { return t0 + T; }
    };

    /**
     * @brief Opaque handle on a full multi-stage solution
     *
     * Only a Sampler can look inside; it re-evaluates the solution at any time
     * of a stage.
     */
    class Gist
    {
    public:
        Gist() = default;

        int getNumStages() const { return static_cast<int>(stages_.size()); }

    private:
        friend class SolveFunction;
        friend class Sampler;

        std::vector<StageSolution> stages_;
    };

    struct SolveResult
    {
        std::vector<StageSolution> stages;
        Gist gist;
        double objective = 0.0;
        double solve_time_ms = 0.0;
    };

    /**
     * @brief Compiled, callable form of a multi-stage problem
     *
     * Takes a StageGuess per stage and returns the optimized stages. Each call
     * re-solves the NLP from the given guess.
     */
    class SolveFunction
    {
    public:
        SolveFunction(casadi::Function function,
                      std::vector<std::string> stage_names);

        SolveResult operator()(const std::vector<StageGuess> &guesses) const;

        const casadi::Function &getFunction() const { return function_; }
        int getNumStages() const { return static_cast<int>(stage_names_.size()); }

    private:
        casadi::Function function_;
        std::vector<std::string> stage_names_;
    };

    /**
     * @brief Multi-stage optimal control problem on top of casadi::Opti
     *
     * Stages are created through addStage and joined with stitch. The total
     * objective is the sum of the stage objectives.
     */
    class MultiStageOCP
    {
    public:
        explicit MultiStageOCP(const SolverOptions &options = SolverOptions());

        MultiStageOCP(const MultiStageOCP &) = delete;
        MultiStageOCP &operator=(const MultiStageOCP &) = delete;

        Stage &addStage(const std::string &name,
                        std::shared_ptr<const DynamicalSystem> model,
                        const StageOptions &options = StageOptions());

        /**
         * @brief Joins two stages: tf(first) == t0(second) and
         *        x_aug(first, tf) == x_aug(second, t0)
         */
        void stitch(const Stage &first, const Stage &second);

        // Adds a constraint expression built from stage variables
        void subjectTo(const casadi::MX &constraint);

        // Compiles the problem into a parametric solve function
        SolveFunction toFunction(const std::string &name);

        const std::vector<std::unique_ptr<Stage>> &getStages() const { return stages_; }
        Stage &getStage(const std::string &name) const;
        const SolverOptions &getOptions() const { return options_; }
        casadi::Opti &getOpti() { return opti_; }

    private:
        int stageIndex(const Stage &stage) const;

        SolverOptions options_;
        casadi::Opti opti_;
        std::vector<std::unique_ptr<Stage>> stages_;
    };

    // Boxed console summary of a solve
    void printSolutionSummary(const SolveResult &result);

} // namespace mstage

#endif // MSTAGE_OCP_HPP
