/**
 * @file sample_covariance.hpp
 * @brief Annualized sample covariance estimator
 *
 * Formula (with bias correction):
 *     Cov = periods_per_year * (1/(T-1)) * (X - mean(X))^T * (X - mean(X))
 *
 * Variance is annualized linearly (multiply by periods per year). Expected
 * returns are compounded elsewhere; the two rules are intentionally
 * different.
 */

#pragma once

#include "risk_model.hpp"

namespace advisor
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief Sample covariance matrix estimator
         *
         * Properties:
         * - Unbiased estimator (with bias_correction = true)
         * - Positive semi-definite in exact arithmetic
         * - Singular when observations do not exceed assets
         *
         * Usage Example:
         * @code
         * SampleCovariance estimator(true, 52.0);  // weekly returns -> annual
         * Eigen::MatrixXd cov = estimator.estimate_covariance(weekly_returns);
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class SampleCovariance : public RiskModel
        {
        public:
            /**
             * @brief Construct sample covariance estimator
             * @param bias_correction Apply Bessel's correction (divide by T-1 vs T)
             * @param annualization_factor Periods per year (1 = no scaling)
             * @throws std::invalid_argument if annualization_factor <= 0
             */
            explicit SampleCovariance(bool bias_correction = true,
                                      double annualization_factor = 1.0);

            ~SampleCovariance() override = default;

            /**
             * @brief Estimate covariance matrix
             * @param returns Matrix of periodic returns (T x N)
             * @return Annualized covariance matrix (N x N)
             * @throws std::invalid_argument if returns is empty or has < 2 observations
             *
             * Time complexity: O(N^2 * T)
             */
            Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const override;

            /**
             * @return "SampleCovariance"
             */
            std::string get_name() const override;

            bool uses_bias_correction() const { return bias_correction_; }

            double annualization_factor() const { return annualization_factor_; }

        private:
            bool bias_correction_;        ///< Whether to apply Bessel's correction
            double annualization_factor_; ///< Periods per year
        };

    } // namespace risk
} // namespace advisor
