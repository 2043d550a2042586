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
#ifndef MSTAGE_HPP
#define MSTAGE_HPP

#include <iostream>
#include <memory>
#include <vector>
#include <Eigen/Dense>

#include "mstage_core/dynamical_system.hpp"
#include "mstage_core/constraint.hpp"
#include "mstage_core/helper.hpp"
#include "mstage_core/options.hpp"
#include "mstage_core/stage.hpp"
#include "mstage_core/ocp.hpp"
#include "mstage_core/trajectory.hpp"
#include "mstage_core/sampler.hpp"
#include "mstage_core/io.hpp"
#include "mstage_core/simulator.hpp"

// Models
#include "dynamics_model/truck_trailer.hpp"

// Scenarios
#include "scenario/corner_maneuver.hpp"

#include "matplot/matplot.h"

#endif // MSTAGE_HPP
