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
// Description: Tests for the YAML parameter and result files.
#include <filesystem>
#include <fstream>

#include <yaml-cpp/yaml.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "mstage_core/helper.hpp"
#include "mstage_core/io.hpp"
#include "scenario/corner_maneuver.hpp"

using namespace mstage;
using ::testing::ElementsAre;
namespace fs = std::filesystem;

namespace {
std::string tempPath(const std::string &name) {
    return (fs::temp_directory_path() / name).string();
}
} // namespace

TEST(IoTest, VehicleParametersRoundTrip) {
    VehicleParameters parameters;
    parameters.truck = {0.3375, 0.06, 0.2};
    parameters.trailer = {0.3 + 1e-13, 1.0 / 3.0, 0.2};

    const std::string path = tempPath("mstage_test_para.yaml");
    saveVehicleParameters(path, parameters);
    VehicleParameters loaded = loadVehicleParameters(path);

    EXPECT_DOUBLE_EQ(loaded.truck.wheelbase, parameters.truck.wheelbase);
    EXPECT_DOUBLE_EQ(loaded.truck.hitch_offset, parameters.truck.hitch_offset);
    EXPECT_DOUBLE_EQ(loaded.truck.width, parameters.truck.width);
    EXPECT_DOUBLE_EQ(loaded.trailer.wheelbase, parameters.trailer.wheelbase);
    EXPECT_DOUBLE_EQ(loaded.trailer.hitch_offset, parameters.trailer.hitch_offset);
    EXPECT_DOUBLE_EQ(loaded.trailer.width, parameters.trailer.width);
    fs::remove(path);
}

TEST(IoTest, ParameterFileErrors) {
    EXPECT_THROW(loadVehicleParameters(tempPath("mstage_does_not_exist.yaml")), YAML::BadFile);

    // No trailer entry
    const std::string path = tempPath("mstage_test_broken_para.yaml");
    {
        std::ofstream file(path);
        file << "truck: {L: 0.3375, M: 0.06, W: 0.2}\n";
    }
    EXPECT_THROW(loadVehicleParameters(path), YAML::Exception);
    fs::remove(path);
}

TEST(IoTest, ResultFileRoundTrip) {
    Eigen::VectorXd time = helper::arange(0.0, 1.0, 0.1);
    const std::vector<std::string> &names = StageSignals::names();
    Eigen::MatrixXd values(names.size(), time.size());
    for (int i = 0; i < values.rows(); ++i) {
        values.row(i) = ((i + 1.0) * time.transpose().array().sin()).matrix();
    }
    Trajectory trajectory(time, names, values);

    const std::string path = tempPath("mstage_test_x_u.yaml");
    saveTrajectory(path, trajectory, resultFileGroups());

    // Layout
    YAML::Node root = YAML::LoadFile(path);
    ASSERT_TRUE(root["x"]);
    ASSERT_TRUE(root["u"]);
    ASSERT_TRUE(root["t"]);
    EXPECT_EQ(root["x"].size(), 6u);
    EXPECT_EQ(root["u"].size(), 2u);
    EXPECT_EQ(root["x"]["py0"].size(), static_cast<size_t>(time.size()));

    Trajectory loaded = loadTrajectory(path);
    EXPECT_THAT(loaded.names(), ElementsAre("x/px1", "x/py1", "x/theta1", "x/px0", "x/py0",
                                            "x/theta0", "u/delta", "u/v_l"));
    EXPECT_TRUE(loaded.time().isApprox(time, 1e-15));
    EXPECT_TRUE(loaded.signal("x/px1").isApprox(trajectory.signal("x1"), 1e-15));
    EXPECT_TRUE(loaded.signal("x/py0").isApprox(trajectory.signal("y0"), 1e-15));
    EXPECT_TRUE(loaded.signal("u/v_l").isApprox(trajectory.signal("v0"), 1e-15));

    // A group may only reference existing signals
    SignalGroups groups = {{"x", {{"px2", "x2"}}}};
    EXPECT_THROW(saveTrajectory(path, trajectory, groups), std::out_of_range);
    fs::remove(path);
}
