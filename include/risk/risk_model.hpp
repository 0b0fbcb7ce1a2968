/**
 * @file risk_model.hpp
 * @brief Abstract interface for covariance estimation methods
 *
 * Provides a common interface for covariance estimators used by the
 * return statistics stage, together with diagnostics the optimizer uses
 * to reject matrices it cannot solve against.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace advisor
{
    namespace risk
    {

        /**
         * @class RiskModel
         * @brief Abstract base class for covariance estimation
         *
         * Usage Example:
         * @code
         * std::unique_ptr<RiskModel> model = std::make_unique<SampleCovariance>(true, 52.0);
         * Eigen::MatrixXd cov = model->estimate_covariance(weekly_returns);
         * if (!RiskModel::is_positive_semidefinite(cov)) { ... }
         * @endcode
         */
        class RiskModel
        {
        public:
            virtual ~RiskModel() = default;

            /**
             * @brief Estimate covariance matrix from return data
             * @param returns Matrix of returns (rows = observations, cols = assets)
             * @return Covariance matrix (n_assets x n_assets)
             * @throws std::invalid_argument if returns matrix is empty
             *
             * @note The returned matrix is guaranteed to be symmetric
             * @note Matrix may not be positive semi-definite when assets
             *       outnumber observations
             */
            virtual Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const = 0;

            /**
             * @brief Get the name of the risk model
             */
            virtual std::string get_name() const = 0;

            /**
             * @brief Smallest eigenvalue of a symmetric matrix
             * @throws std::invalid_argument if the matrix is empty or not square
             */
            static double minimum_eigenvalue(const Eigen::MatrixXd &covariance);

            /**
             * @brief Check positive semi-definiteness up to a relative tolerance
             *
             * Passes when the smallest eigenvalue is at least
             * -relative_tolerance * max(1, largest |eigenvalue|).
             */
            static bool is_positive_semidefinite(const Eigen::MatrixXd &covariance,
                                                 double relative_tolerance = 1e-10);

            /**
             * @brief Check exact-to-tolerance symmetry
             */
            static bool is_symmetric(const Eigen::MatrixXd &matrix, double tolerance = 1e-12);

        protected:
            /**
             * @brief Validate input returns matrix
             * @throws std::invalid_argument if validation fails
             */
            static void validate_returns(const Eigen::MatrixXd &returns);

            /**
             * @brief Enforce symmetry: (M + M^T) / 2
             */
            static Eigen::MatrixXd ensure_symmetric(const Eigen::MatrixXd &matrix);
        };

    } // namespace risk
} // namespace advisor
