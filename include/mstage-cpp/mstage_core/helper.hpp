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

#ifndef MSTAGE_HELPER_HPP
#define MSTAGE_HELPER_HPP

#include <Eigen/Dense>
#include <casadi/casadi.hpp>
#include <stdexcept>

namespace mstage
{
     /**
      * @brief Compute Jacobian using central finite differences
      * @param f Function to differentiate
      * @param x Point at which to evaluate Jacobian
      * @param h Step size for finite differences
      * @return Jacobian matrix
      */
     template <typename F>
     Eigen::MatrixXd finite_difference_jacobian_central(const F &f,
                                                        const Eigen::VectorXd &x,
                                                        double h)
     {
          const int n = x.size();
          Eigen::MatrixXd jac(f(x).size(), n);

          Eigen::VectorXd x_plus = x;
          Eigen::VectorXd x_minus = x;
          for (int i = 0; i < n; ++i)
          {
               x_plus(i) += h;
               x_minus(i) -= h;
               jac.col(i) = (f(x_plus) - f(x_minus)) / (2.0 * h);
               x_plus(i) = x(i);
               x_minus(i) = x(i);
          }
          return jac;
     }

     /**
      * @brief Compute Jacobian using forward finite differences
      */
     template <typename F>
     Eigen::MatrixXd finite_difference_jacobian_forward(const F &f,
                                                        const Eigen::VectorXd &x,
                                                        double h)
     {
          const Eigen::VectorXd f0 = f(x);
          Eigen::MatrixXd jac(f0.size(), x.size());

          Eigen::VectorXd x_plus = x;
          for (int i = 0; i < x.size(); ++i)
          {
               x_plus(i) += h;
               jac.col(i) = (f(x_plus) - f0) / h;
               x_plus(i) = x(i);
          }
          return jac;
     }

     /*
      * @brief Compute Jacobian using finite differences
      * @param f Function to differentiate
      * @param x Point at which to evaluate Jacobian
      * @param h Step size for finite differences (optional)
      * @param mode 0 for central, 1 for forward
      * @return Jacobian matrix
      */
     template <typename F>
     Eigen::MatrixXd finite_difference_jacobian(const F &f,
                                                const Eigen::VectorXd &x,
                                                double h = 2e-5,
                                                int mode = 0)
     {
          if (mode == 0)
          {
               return finite_difference_jacobian_central(f, x, h);
          }
          else if (mode == 1)
          {
               return finite_difference_jacobian_forward(f, x, h);
          }
          throw std::invalid_argument("Invalid mode value for finite difference Jacobian");
     }

     namespace helper
     {
          // num points evenly spaced over [start, stop], both ends included
          Eigen::VectorXd linspace(double start, double stop, int num);

          // Half-open grid start, start + step, ... strictly below stop
          Eigen::VectorXd arange(double start, double stop, double step);

          // Eigen <-> CasADi numeric matrices
          casadi::DM toDM(const Eigen::MatrixXd &m);
          Eigen::MatrixXd toEigen(const casadi::DM &m);

     } // namespace helper
} // namespace mstage

#endif // MSTAGE_HELPER_HPP
