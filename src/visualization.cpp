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
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "visualization.hpp"

namespace mstage {

namespace {
std::vector<double> toStd(const Eigen::VectorXd& v) {
    return std::vector<double>(v.data(), v.data() + v.size());
}

void plotSegment(const matplot::axes_handle& ax, const std::array<Eigen::Vector2d, 2>& segment,
                 const std::string& line_spec) {
    matplot::plot(ax, std::vector<double>{segment[0](0), segment[1](0)},
                  std::vector<double>{segment[0](1), segment[1](1)}, line_spec);
}
} // namespace

std::array<Eigen::Vector2d, 2> halfPlaneSegment(const Eigen::Vector3d& w, double extent) {
    const Eigen::Vector2d n = w.head<2>();
    const double norm = n.norm();
    if (norm == 0.0) {
        throw std::invalid_argument("halfPlaneSegment: half-plane normal is zero");
    }
    const Eigen::Vector2d closest = -w(2) * n / (norm * norm);
    const Eigen::Vector2d direction(-n(1) / norm, n(0) / norm);
    return {closest - extent * direction, closest + extent * direction};
}

Eigen::Matrix<double, 2, 5> bodyOutline(double x, double y, double theta,
                                        const BodyGeometry& body) {
    const Eigen::Vector2d p(x, y);
    const Eigen::Vector2d forward(std::cos(theta), std::sin(theta));
    const Eigen::Vector2d left(-std::sin(theta), std::cos(theta));
    const double half = 0.5 * body.width;

    Eigen::Matrix<double, 2, 5> outline;
    outline.col(0) = p + body.wheelbase * forward + half * left;
    outline.col(1) = p + body.wheelbase * forward - half * left;
    outline.col(2) = p - body.hitch_offset * forward - half * left;
    outline.col(3) = p - body.hitch_offset * forward + half * left;
    outline.col(4) = outline.col(0);
    return outline;
}

std::array<Eigen::Vector2d, 2> wheelSegment(double x, double y, double theta,
                                            double longitudinal, double lateral,
                                            double steering, double radius) {
    const Eigen::Vector2d forward(std::cos(theta), std::sin(theta));
    const Eigen::Vector2d left(-std::sin(theta), std::cos(theta));
    const Eigen::Vector2d center = Eigen::Vector2d(x, y) + longitudinal * forward + lateral * left;
    const Eigen::Vector2d wheel(std::cos(theta + steering), std::sin(theta + steering));
    return {center - radius * wheel, center + radius * wheel};
}

ManeuverPlot::ManeuverPlot(std::shared_ptr<const TruckTrailer> model,
                           const PlotOptions& options)
    : model_(std::move(model)), options_(options) {
    if (!model_) {
        throw std::invalid_argument("ManeuverPlot: model must not be null");
    }
}

void ManeuverPlot::drawScene(const matplot::axes_handle& ax,
                             const Trajectory& plan,
                             const std::vector<StageSolution>& stages,
                             const std::vector<Eigen::Vector3d>& walls) {
    matplot::hold(ax, true);

    for (const auto& w : walls) {
        plotSegment(ax, halfPlaneSegment(w, options_.wall_extent), "r-");
    }

    matplot::plot(ax, toStd(plan.signal("x0")), toStd(plan.signal("y0")), "-")
        ->color("gray");
    matplot::plot(ax, toStd(plan.signal("x1")), toStd(plan.signal("y1")), "r-");

    // Stage boundaries of the trailer axle
    for (const auto& stage : stages) {
        const int last = static_cast<int>(stage.states.cols()) - 1;
        for (int node : {0, last}) {
            matplot::plot(ax, std::vector<double>{stage.states(TruckTrailer::STATE_X1, node)},
                          std::vector<double>{stage.states(TruckTrailer::STATE_Y1, node)}, "kx");
        }
    }

    matplot::axis(ax, matplot::equal);
    matplot::ylim(ax, {options_.y_min, options_.y_max});
}

void ManeuverPlot::drawVehicle(const matplot::axes_handle& ax, const Eigen::VectorXd& state,
                               double steering) {
    const BodyGeometry& truck = model_->geometry(TruckTrailer::Body::Truck);
    BodyGeometry trailer = model_->geometry(TruckTrailer::Body::Trailer);
    trailer.wheelbase *= options_.trailer_length_scale;

    const Eigen::Vector2d p0 = model_->truckPosition(state);
    const double theta0 = state(TruckTrailer::STATE_THETA0);
    const double x1 = state(TruckTrailer::STATE_X1);
    const double y1 = state(TruckTrailer::STATE_Y1);
    const double theta1 = state(TruckTrailer::STATE_THETA1);
    const double r = options_.wheel_radius;

    // Truck with steered front wheel and fixed rear wheels
    Eigen::Matrix<double, 2, 5> outline = bodyOutline(p0(0), p0(1), theta0, truck);
    matplot::plot(ax, toStd(outline.row(0).transpose()), toStd(outline.row(1).transpose()), "-")
        ->color("gray");
    plotSegment(ax, wheelSegment(p0(0), p0(1), theta0, truck.wheelbase, 0.0, steering, r), "k-");
    plotSegment(ax, wheelSegment(p0(0), p0(1), theta0, 0.0, 0.5 * truck.width, 0.0, r), "k-");
    plotSegment(ax, wheelSegment(p0(0), p0(1), theta0, 0.0, -0.5 * truck.width, 0.0, r), "k-");
    matplot::plot(ax, std::vector<double>{p0(0)}, std::vector<double>{p0(1)}, "x")
        ->color("gray");

    // Trailer
    outline = bodyOutline(x1, y1, theta1, trailer);
    matplot::plot(ax, toStd(outline.row(0).transpose()), toStd(outline.row(1).transpose()), "r-");
    plotSegment(ax, wheelSegment(x1, y1, theta1, 0.0, 0.5 * trailer.width, 0.0, r), "k-");
    plotSegment(ax, wheelSegment(x1, y1, theta1, 0.0, -0.5 * trailer.width, 0.0, r), "k-");
    matplot::plot(ax, std::vector<double>{x1}, std::vector<double>{y1}, "rx");

    // Coupling bar and hitch
    const Eigen::Vector2d hitch = model_->hitchPoint(state);
    matplot::plot(ax, std::vector<double>{x1, hitch(0)}, std::vector<double>{y1, hitch(1)}, "k-");
    matplot::plot(ax, std::vector<double>{hitch(0)}, std::vector<double>{hitch(1)}, "ko");
}

void ManeuverPlot::plotOverview(const Trajectory& plan,
                                const std::vector<StageSolution>& stages,
                                const std::vector<Eigen::Vector3d>& walls) {
    overview_ = matplot::figure(true);
    auto ax = overview_->current_axes();
    drawScene(ax, plan, stages, walls);
    matplot::title(ax, "Truck-trailer corner maneuver");
    matplot::xlabel(ax, "x [m]");
    matplot::ylabel(ax, "y [m]");
}

void ManeuverPlot::animate(const Trajectory& plan,
                           const std::vector<StageSolution>& stages,
                           const std::vector<Eigen::Vector3d>& walls,
                           const Trajectory& simulated) {
    if (!overview_) {
        overview_ = matplot::figure(true);
    }
    auto ax = overview_->current_axes();

    std::unique_ptr<Animation> animation;
    if (options_.save_frames) {
        animation = std::make_unique<Animation>(overview_, options_.animation);
    }

    const Eigen::VectorXd theta1 = plan.signal("theta1");
    const Eigen::VectorXd x1 = plan.signal("x1");
    const Eigen::VectorXd y1 = plan.signal("y1");
    const Eigen::VectorXd theta0 = plan.signal("theta0");
    const Eigen::VectorXd delta0 = plan.signal("delta0");

    Eigen::VectorXd state(TruckTrailer::STATE_DIM);
    for (int k = 0; k + 1 < plan.size(); ++k) {
        matplot::cla(ax);
        drawScene(ax, plan, stages, walls);

        state << theta1(k), x1(k), y1(k), theta0(k);
        drawVehicle(ax, state, delta0(k));

        if (!simulated.empty()) {
            matplot::plot(ax, std::vector<double>{simulated.signal("px0")(k)},
                          std::vector<double>{simulated.signal("py0")(k)}, ".")
                ->color({0.35f, 0.35f, 0.35f});
            matplot::plot(ax, std::vector<double>{simulated.signal("px1")(k)},
                          std::vector<double>{simulated.signal("py1")(k)}, ".")
                ->color({0.55f, 0.0f, 0.0f});
        }

        overview_->draw();
        if (animation) {
            animation->saveFrame(k);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(options_.frame_pause_ms));
    }

    if (animation && animation->createGif(options_.gif_name)) {
        std::cout << "Animation saved as " << animation->getConfig().output_dir << "/"
                  << options_.gif_name << std::endl;
    }
}

void ManeuverPlot::plotControls(const Trajectory& plan) {
    controls_ = matplot::figure(true);
    const std::vector<double> t = toStd(plan.time());

    auto ax_steering = matplot::subplot(controls_, 1, 2, 0);
    matplot::plot(ax_steering, t, toStd(plan.signal("delta0")));
    matplot::title(ax_steering, "Steering angle");
    matplot::xlabel(ax_steering, "t [s]");

    auto ax_velocity = matplot::subplot(controls_, 1, 2, 1);
    matplot::plot(ax_velocity, t, toStd(plan.signal("v0")));
    matplot::title(ax_velocity, "Velocity");
    matplot::xlabel(ax_velocity, "t [s]");
}

void ManeuverPlot::plotArticulation(const Trajectory& plan, const Trajectory& simulated) {
    articulation_ = matplot::figure(true);
    auto ax = articulation_->current_axes();
    matplot::hold(ax, true);

    const std::vector<double> t = toStd(plan.time());
    matplot::plot(ax, t, toStd(simulated.signal("beta01")));
    matplot::plot(ax, t, toStd(plan.signal("theta0") - plan.signal("theta1")));
    matplot::legend(ax, {"sim", "ctrl"});
    matplot::xlabel(ax, "t [s]");
    matplot::ylabel(ax, "beta01 [rad]");
}

void ManeuverPlot::show() {
    for (const auto& figure : {overview_, controls_, articulation_}) {
        if (figure) {
            figure->show();
        }
    }
}

} // namespace mstage
