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
#ifndef MSTAGE_TRAJECTORY_HPP
#define MSTAGE_TRAJECTORY_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace mstage
{
    /**
     * @brief Sampled time series with named signals
     *
     * Time is strictly increasing. Signal values are stored row-wise, one row
     * per signal and one column per time sample.
     */
    class Trajectory
    {
    public:
        Trajectory() = default;

        Trajectory(const Eigen::VectorXd &time,
                   const std::vector<std::string> &names,
                   const Eigen::MatrixXd &values);

        int size() const { return static_cast<int>(time_.size()); }
        int getNumSignals() const { return static_cast<int>(names_.size()); }
        bool empty() const { return time_.size() == 0; }

        const Eigen::VectorXd &time() const { return time_; }
        const std::vector<std::string> &names() const { return names_; }
        const Eigen::MatrixXd &values() const { return values_; }

        bool hasSignal(const std::string &name) const;

        // Throws std::out_of_range for an unknown name
        Eigen::VectorXd signal(const std::string &name) const;

        // Appends a signal of the same length as time()
        void addSignal(const std::string &name, const Eigen::VectorXd &values);

        // Restricts to the given signal names, in that order
        Trajectory select(const std::vector<std::string> &names) const;

        /**
         * @brief Joins two trajectories with the same signals in time order
         *
         * Every time of @p second must come after the last time of @p first.
         */
        static Trajectory concatenate(const Trajectory &first, const Trajectory &second);

    private:
        int indexOf(const std::string &name) const;

        Eigen::VectorXd time_;
        std::vector<std::string> names_;
        Eigen::MatrixXd values_;
    };

} // namespace mstage

#endif // MSTAGE_TRAJECTORY_HPP
