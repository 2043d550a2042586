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
#include <fstream>
#include <limits>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

#include "mstage_core/io.hpp"

namespace mstage
{

namespace
{
BodyGeometry readBody(const YAML::Node &node)
{
    BodyGeometry body;
    body.wheelbase = node["L"].as<double>();
    body.hitch_offset = node["M"].as<double>();
    body.width = node["W"].as<double>();
    return body;
}

void writeBody(YAML::Emitter &out, const std::string &key, const BodyGeometry &body)
{
    out << YAML::Key << key << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "L" << YAML::Value << body.wheelbase;
    out << YAML::Key << "M" << YAML::Value << body.hitch_offset;
    out << YAML::Key << "W" << YAML::Value << body.width;
    out << YAML::EndMap;
}

void writeSequence(YAML::Emitter &out, const Eigen::VectorXd &values)
{
    out << YAML::Flow << YAML::BeginSeq;
    for (int k = 0; k < values.size(); ++k)
    {
        out << values(k);
    }
    out << YAML::EndSeq;
}

Eigen::VectorXd readSequence(const YAML::Node &node)
{
    const std::vector<double> values = node.as<std::vector<double>>();
    return Eigen::Map<const Eigen::VectorXd>(values.data(), values.size());
}

void writeDocument(const std::string &path, const YAML::Emitter &out)
{
    if (!out.good())
    {
        throw std::runtime_error("YAML emitter error: " + out.GetLastError());
    }
    std::ofstream file(path);
    if (!file)
    {
        throw std::runtime_error("Cannot open '" + path + "' for writing");
    }
    file << out.c_str() << "\n";
}
} // namespace

VehicleParameters loadVehicleParameters(const std::string &path)
{
    const YAML::Node root = YAML::LoadFile(path);

    VehicleParameters parameters;
    parameters.truck = readBody(root["truck"]);
    parameters.trailer = readBody(root["trailer1"]);
    return parameters;
}

void saveVehicleParameters(const std::string &path, const VehicleParameters &parameters)
{
    YAML::Emitter out;
    out.SetDoublePrecision(std::numeric_limits<double>::max_digits10);
    out << YAML::BeginMap;
    writeBody(out, "truck", parameters.truck);
    writeBody(out, "trailer1", parameters.trailer);
    out << YAML::EndMap;
    writeDocument(path, out);
}

void saveTrajectory(const std::string &path,
                    const Trajectory &trajectory,
                    const SignalGroups &groups)
{
    YAML::Emitter out;
    out.SetDoublePrecision(std::numeric_limits<double>::max_digits10);
    out << YAML::BeginMap;
    for (const auto &group : groups)
    {
        out << YAML::Key << group.first << YAML::Value << YAML::BeginMap;
        for (const auto &entry : group.second)
        {
            out << YAML::Key << entry.first << YAML::Value;
            writeSequence(out, trajectory.signal(entry.second));
        }
        out << YAML::EndMap;
    }
    out << YAML::Key << "t" << YAML::Value;
    writeSequence(out, trajectory.time());
    out << YAML::EndMap;
    writeDocument(path, out);
}

Trajectory loadTrajectory(const std::string &path)
{
    const YAML::Node root = YAML::LoadFile(path);
    if (!root["t"])
    {
        throw std::invalid_argument("loadTrajectory: '" + path + "' has no time vector 't'");
    }
    const Eigen::VectorXd time = readSequence(root["t"]);

    Trajectory trajectory(time, {}, Eigen::MatrixXd(0, time.size()));
    for (const auto &group : root)
    {
        const std::string group_name = group.first.as<std::string>();
        if (group_name == "t")
        {
            continue;
        }
        for (const auto &entry : group.second)
        {
            trajectory.addSignal(group_name + "/" + entry.first.as<std::string>(),
                                 readSequence(entry.second));
        }
    }
    return trajectory;
}

} // namespace mstage
