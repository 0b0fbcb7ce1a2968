/**
 * @file portfolio_metrics.cpp
 * @brief Implementation of PortfolioMetrics and normal distribution helpers.
 */

#include "analytics/portfolio_metrics.hpp"
#include "core/advisor_error.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace advisor
{
    namespace analytics
    {

        // ===================================================================
        // Normal distribution helpers
        // ===================================================================

        double normal_pdf(double x)
        {
            static const double INV_SQRT_2PI = 0.3989422804014327;
            return INV_SQRT_2PI * std::exp(-0.5 * x * x);
        }

        double inverse_normal_cdf(double p)
        {
            if (!(p > 0.0 && p < 1.0))
            {
                throw std::invalid_argument(
                    "inverse_normal_cdf requires p in (0, 1), got: " + std::to_string(p));
            }

            static const double a[] = {
                -3.969683028665376e+01, 2.209460984245205e+02,
                -2.759285104469687e+02, 1.383577518672690e+02,
                -3.066479806614716e+01, 2.506628277459239e+00};
            static const double b[] = {
                -5.447609879822406e+01, 1.615858368580409e+02,
                -1.556989798598866e+02, 6.680131188771972e+01,
                -1.328068155288572e+01};
            static const double c[] = {
                -7.784894002430293e-03, -3.223964580411365e-01,
                -2.400758277161838e+00, -2.549732539343734e+00,
                4.374664141464968e+00, 2.938163982698783e+00};
            static const double d[] = {
                7.784695709041462e-03, 3.224671290700398e-01,
                2.445134137142996e+00, 3.754408661907416e+00};

            static const double P_LOW = 0.02425;
            static const double P_HIGH = 1.0 - P_LOW;

            if (p < P_LOW)
            {
                double q = std::sqrt(-2.0 * std::log(p));
                return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
                       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
            }

            if (p > P_HIGH)
            {
                double q = std::sqrt(-2.0 * std::log(1.0 - p));
                return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
                       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
            }

            double q = p - 0.5;
            double r = q * q;
            return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
                   (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
        }

        // ===================================================================
        // PortfolioMetrics
        // ===================================================================

        PortfolioMetrics::PortfolioMetrics(double risk_free_rate, double confidence)
            : risk_free_rate_(risk_free_rate), confidence_(confidence), tail_factor_(0.0)
        {
            if (!(confidence > 0.0 && confidence < 1.0))
            {
                throw std::invalid_argument(
                    "CVaR confidence must be in (0, 1), got: " + std::to_string(confidence));
            }
            if (!std::isfinite(risk_free_rate))
            {
                throw std::invalid_argument("risk_free_rate must be finite");
            }

            tail_factor_ = normal_pdf(inverse_normal_cdf(confidence_)) / (1.0 - confidence_);
        }

        double PortfolioMetrics::expected_return(const Eigen::VectorXd &weights,
                                                 const Eigen::VectorXd &expected_returns) const
        {
            return expected_returns.dot(weights);
        }

        double PortfolioMetrics::variance(const Eigen::VectorXd &weights,
                                          const Eigen::MatrixXd &covariance) const
        {
            return weights.dot(covariance * weights);
        }

        double PortfolioMetrics::volatility(const Eigen::VectorXd &weights,
                                            const Eigen::MatrixXd &covariance) const
        {
            return std::sqrt(std::max(0.0, variance(weights, covariance)));
        }

        double PortfolioMetrics::sharpe_ratio(const Eigen::VectorXd &weights,
                                              const Eigen::VectorXd &expected_returns,
                                              const Eigen::MatrixXd &covariance) const
        {
            double var = variance(weights, covariance);
            if (!(var > MIN_VARIANCE))
            {
                throw AdvisorError(ErrorCode::DEGENERATE_BASELINE,
                                   "Portfolio variance is zero; Sharpe ratio is undefined",
                                   {{"variance", std::isfinite(var) ? var : 0.0}});
            }

            return (expected_return(weights, expected_returns) - risk_free_rate_) / std::sqrt(var);
        }

        double PortfolioMetrics::conditional_var(const Eigen::VectorXd &weights,
                                                 const Eigen::VectorXd &expected_returns,
                                                 const Eigen::MatrixXd &covariance) const
        {
            double mean = expected_return(weights, expected_returns);
            double std_dev = volatility(weights, covariance);
            return -(mean - std_dev * tail_factor_);
        }

    } // namespace analytics
} // namespace advisor
