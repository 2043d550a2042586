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
#include <Eigen/Dense>
#include <cmath>
#include "mstage_core/helper.hpp"

namespace mstage
{
     namespace helper
     {
          Eigen::VectorXd linspace(double start, double stop, int num)
          {
               if (num < 0)
               {
                    throw std::invalid_argument("linspace: num must be non-negative");
               }
               if (num == 1)
               {
                    return Eigen::VectorXd::Constant(1, start);
               }
               return Eigen::VectorXd::LinSpaced(num, start, stop);
          }

          Eigen::VectorXd arange(double start, double stop, double step)
          {
               if (step <= 0.0)
               {
                    throw std::invalid_argument("arange: step must be positive");
               }
               const double span = (stop - start) / step;
               int num = span > 0.0 ? static_cast<int>(std::ceil(span)) : 0;
               // Rounding can put the last point on stop
               while (num > 0 && start + (num - 1) * step >= stop)
               {
                    --num;
               }

               Eigen::VectorXd grid(num);
               for (int i = 0; i < num; ++i)
               {
                    grid(i) = start + i * step;
               }
               return grid;
          }

          casadi::DM toDM(const Eigen::MatrixXd &m)
          {
               casadi::DM result = casadi::DM::zeros(m.rows(), m.cols());
               for (int i = 0; i < m.rows(); ++i)
               {
                    for (int j = 0; j < m.cols(); ++j)
                    {
                         result(i, j) = m(i, j);
                    }
               }
               return result;
          }

          Eigen::MatrixXd toEigen(const casadi::DM &m)
          {
               Eigen::MatrixXd result(m.size1(), m.size2());
               const std::vector<double> data = m.get_elements(); // dense, column-major
               for (int j = 0; j < result.cols(); ++j)
               {
                    for (int i = 0; i < result.rows(); ++i)
                    {
                         result(i, j) = data[j * result.rows() + i];
                    }
               }
               return result;
          }

     } // namespace helper
} // namespace mstage
