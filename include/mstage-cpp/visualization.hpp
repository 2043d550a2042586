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

#ifndef MSTAGE_VISUALIZATION_HPP
#define MSTAGE_VISUALIZATION_HPP

#include <Eigen/Dense>
#include <array>
#include <memory>
#include <string>
#include <vector>

#include "matplot/matplot.h"

#include "animation.hpp"
#include "dynamics_model/truck_trailer.hpp"
#include "mstage_core/ocp.hpp"
#include "mstage_core/trajectory.hpp"

namespace mstage {

struct PlotOptions {
    double wheel_radius = 0.025;        // Half length of a drawn wheel
    double trailer_length_scale = 0.8;  // Drawn trailer length as a fraction of L1
    double wall_extent = 10.0;          // Half length of a drawn wall line
    double y_min = -2.0;
    double y_max = 4.0;
    int frame_pause_ms = 1;             // Pause after each animation frame
    bool save_frames = false;           // Export frames and assemble a GIF
    std::string gif_name = "truck_trailer.gif";
    Animation::AnimationConfig animation;
};

// Two points of the boundary line n.p + c = 0 of w = [n; c], extent away from
// its point closest to the origin
std::array<Eigen::Vector2d, 2> halfPlaneSegment(const Eigen::Vector3d& w, double extent);

// Closed outline (5 points) of a body rectangle, L ahead and M behind (x, y)
Eigen::Matrix<double, 2, 5> bodyOutline(double x, double y, double theta,
                                        const BodyGeometry& body);

// Wheel drawn as a segment centered at (longitudinal, lateral) in the body
// frame, turned by steering relative to the heading
std::array<Eigen::Vector2d, 2> wheelSegment(double x, double y, double theta,
                                            double longitudinal, double lateral,
                                            double steering, double radius);

/**
 * @brief Figures of the truck-trailer corner maneuver
 *
 * Figure 1 holds the corridor, the paths, the stage boundaries and the
 * animated vehicle, figure 2 the steering and velocity traces and figure 3
 * the simulated against the planned articulation angle.
 */
class ManeuverPlot {
public:
    ManeuverPlot(std::shared_ptr<const TruckTrailer> model,
                 const PlotOptions& options = PlotOptions());

    // Figure 1 without the vehicle
    void plotOverview(const Trajectory& plan,
                      const std::vector<StageSolution>& stages,
                      const std::vector<Eigen::Vector3d>& walls);

    // Figure 1 animation; simulated may be empty
    void animate(const Trajectory& plan,
                 const std::vector<StageSolution>& stages,
                 const std::vector<Eigen::Vector3d>& walls,
                 const Trajectory& simulated);

    // Figure 2
    void plotControls(const Trajectory& plan);

    // Figure 3
    void plotArticulation(const Trajectory& plan, const Trajectory& simulated);

    void show();

private:
    void drawScene(const matplot::axes_handle& ax,
                   const Trajectory& plan,
                   const std::vector<StageSolution>& stages,
                   const std::vector<Eigen::Vector3d>& walls);
    void drawVehicle(const matplot::axes_handle& ax, const Eigen::VectorXd& state, double steering);

    std::shared_ptr<const TruckTrailer> model_;
    PlotOptions options_;
    matplot::figure_handle overview_;
    matplot::figure_handle controls_;
    matplot::figure_handle articulation_;
};

} // namespace mstage

#endif // MSTAGE_VISUALIZATION_HPP
