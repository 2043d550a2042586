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
#include <stdexcept>

#include "mstage_core/trajectory.hpp"

namespace mstage
{

Trajectory::Trajectory(const Eigen::VectorXd &time,
                       const std::vector<std::string> &names,
                       const Eigen::MatrixXd &values)
    : time_(time), names_(names), values_(values)
{
    if (values_.rows() != static_cast<int>(names_.size()) || values_.cols() != time_.size())
    {
        throw std::invalid_argument("Trajectory: values must be " + std::to_string(names_.size()) +
                                    " x " + std::to_string(time_.size()) + ", got " +
                                    std::to_string(values_.rows()) + " x " + std::to_string(values_.cols()));
    }
    for (int k = 1; k < time_.size(); ++k)
    {
        if (!(time_(k) > time_(k - 1)))
        {
            throw std::invalid_argument("Trajectory: time must be strictly increasing (index " +
                                        std::to_string(k) + ")");
        }
    }
    for (size_t i = 0; i < names_.size(); ++i)
    {
        if (std::find(names_.begin() + i + 1, names_.end(), names_[i]) != names_.end())
        {
            throw std::invalid_argument("Trajectory: duplicate signal '" + names_[i] + "'");
        }
    }
}

int Trajectory::indexOf(const std::string &name) const
{
    auto it = std::find(names_.begin(), names_.end(), name);
    return it == names_.end() ? -1 : static_cast<int>(it - names_.begin());
}

bool Trajectory::hasSignal(const std::string &name) const
{
    return indexOf(name) >= 0;
}

Eigen::VectorXd Trajectory::signal(const std::string &name) const
{
    const int i = indexOf(name);
    if (i < 0)
    {
        throw std::out_of_range("Trajectory: no signal named '" + name + "'");
    }
    return values_.row(i).transpose();
}

void Trajectory::addSignal(const std::string &name, const Eigen::VectorXd &values)
{
    if (values.size() != time_.size())
    {
        throw std::invalid_argument("Trajectory: signal '" + name + "' has " + std::to_string(values.size()) +
                                    " samples, expected " + std::to_string(time_.size()));
    }
    if (hasSignal(name))
    {
        throw std::invalid_argument("Trajectory: duplicate signal '" + name + "'");
    }
    values_.conservativeResize(values_.rows() + 1, time_.size());
    values_.row(values_.rows() - 1) = values.transpose();
    names_.push_back(name);
}

Trajectory Trajectory::select(const std::vector<std::string> &names) const
{
    Eigen::MatrixXd values(names.size(), time_.size());
    for (size_t i = 0; i < names.size(); ++i)
    {
        values.row(i) = signal(names[i]).transpose();
    }
    return Trajectory(time_, names, values);
}

Trajectory Trajectory::concatenate(const Trajectory &first, const Trajectory &second)
{
    if (first.empty())
    {
        return second;
    }
    if (second.empty())
    {
        return first;
    }
    if (first.names() != second.names())
    {
        throw std::invalid_argument("Trajectory::concatenate: signal names differ");
    }

    Eigen::VectorXd time(first.size() + second.size());
    time << first.time(), second.time();

    Eigen::MatrixXd values(first.getNumSignals(), time.size());
    values << first.values(), second.values();

    // The constructor rejects overlapping time ranges
    return Trajectory(time, first.names(), values);
}

} // namespace mstage
