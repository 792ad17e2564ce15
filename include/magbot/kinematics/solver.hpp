#pragma once

#include <Eigen/Core>
#include <Eigen/Dense>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/error.hpp>
#include <datapod/pods/adapters/result.hpp>

#include "magbot/kinematics/chain.hpp"

namespace magbot {
    namespace kinematics {

        struct SolverParams {
            dp::u32 max_iterations = 300;
            dp::f64 damping = 0.05;  // lambda
            dp::f64 step = 1.0;      // fraction of the DLS update applied per iteration
            dp::f64 tolerance = 1e-4; // meters
        };

        struct Solution {
            dp::Vector<dp::f64> angles;                        // radians, chain order
            Eigen::Vector3d predicted = Eigen::Vector3d::Zero(); // FK of `angles`
            dp::f64 residual = 0.0;                            // |predicted - target|
            dp::u32 iterations = 0;
        };

        /// Position-only inverse kinematics by damped least squares.
        ///
        /// Seeded with `seed` (radians, one per DOF, clamped into bounds first). Every update is
        /// clamped to the joint bounds and the best configuration seen is returned together with
        /// its forward-kinematics position. The solve never judges feasibility; callers compare
        /// `predicted` with the target.
        inline dp::Result<Solution> solve(const Chain &chain, const Eigen::Vector3d &target,
                                          const dp::Vector<dp::f64> &seed, const SolverParams &params = {}) {
            const dp::usize n = chain.dof();
            if (seed.size() != n) {
                return dp::Result<Solution>::err(dp::Error::invalid_argument("seed size does not match chain dof"));
            }

            dp::Vector<dp::f64> q = chain.clamp(seed);
            ChainState st = chain.walk(q);

            Solution best;
            best.angles = q;
            best.predicted = st.end;
            best.residual = (target - st.end).norm();

            const dp::f64 lambda2 = params.damping * params.damping;
            Eigen::MatrixXd jac(3, static_cast<Eigen::Index>(n));

            dp::u32 it = 0;
            for (; it < params.max_iterations && best.residual > params.tolerance; ++it) {
                const Eigen::Vector3d err = target - st.end;

                for (dp::usize i = 0; i < n; ++i) {
                    jac.col(static_cast<Eigen::Index>(i)) = st.axes[i].cross(st.end - st.origins[i]);
                }

                const Eigen::Matrix3d a = jac * jac.transpose() + lambda2 * Eigen::Matrix3d::Identity();
                const Eigen::VectorXd dq = jac.transpose() * a.ldlt().solve(err);

                for (dp::usize i = 0; i < n; ++i) {
                    q[i] += params.step * dq(static_cast<Eigen::Index>(i));
                }
                q = chain.clamp(q);
                st = chain.walk(q);

                const dp::f64 residual = (target - st.end).norm();
                if (residual < best.residual) {
                    best.angles = q;
                    best.predicted = st.end;
                    best.residual = residual;
                }
            }
            best.iterations = it;

            return dp::Result<Solution>::ok(best);
        }

    } // namespace kinematics
} // namespace magbot
