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
#ifndef MSTAGE_IO_HPP
#define MSTAGE_IO_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "dynamics_model/truck_trailer.hpp"
#include "mstage_core/trajectory.hpp"

namespace mstage
{
    /**
     * @brief Reads truck-trailer geometry from a YAML file
     *
     * Schema:
     *   truck:    {L: ..., M: ..., W: ...}
     *   trailer1: {L: ..., M: ..., W: ...}
     *
     * @throws YAML::BadFile, YAML::InvalidNode or YAML::BadConversion
     */
    VehicleParameters loadVehicleParameters(const std::string &path);

    void saveVehicleParameters(const std::string &path, const VehicleParameters &parameters);

    /**
     * @brief Signal groups of a result file: group key -> (file key, signal name)
     */
    using SignalGroups =
        std::vector<std::pair<std::string, std::vector<std::pair<std::string, std::string>>>>;

    /**
     * @brief Writes a trajectory as a YAML document of grouped arrays
     *
     * Each group becomes a map of file keys to sequences; the time vector is
     * written under "t".
     */
    void saveTrajectory(const std::string &path,
                        const Trajectory &trajectory,
                        const SignalGroups &groups);

    /**
     * @brief Reads a document written by saveTrajectory
     *
     * Signals are named "<group>/<key>" in document order.
     */
    Trajectory loadTrajectory(const std::string &path);

} // namespace mstage

#endif // MSTAGE_IO_HPP
