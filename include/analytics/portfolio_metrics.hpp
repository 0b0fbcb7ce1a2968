/**
 * @file portfolio_metrics.hpp
 * @brief Closed-form risk and return metrics for a weight vector.
 *
 * All inputs are annualized (mu, Sigma). CVaR uses the normal
 * approximation: returns are treated as N(mu . w, w' Sigma w).
 */

#ifndef ADVISOR_ANALYTICS_PORTFOLIO_METRICS_HPP
#define ADVISOR_ANALYTICS_PORTFOLIO_METRICS_HPP

#include <Eigen/Dense>

namespace advisor
{
    namespace analytics
    {

        /**
         * @brief Standard normal PDF: phi(x) = (1/sqrt(2*pi)) * exp(-x^2/2).
         */
        double normal_pdf(double x);

        /**
         * @brief Inverse standard normal CDF (probit), Acklam's rational approximation.
         *
         * Relative error about 1.15e-9 over the whole open interval.
         *
         * @param p Probability in (0, 1).
         * @return z such that Phi(z) = p.
         * @throws std::invalid_argument if p is outside (0, 1)
         */
        double inverse_normal_cdf(double p);

        /**
         * @class PortfolioMetrics
         * @brief Sharpe ratio and parametric CVaR evaluator.
         *
         * Usage Example:
         * @code
         * PortfolioMetrics metrics(0.043, 0.95);
         * double s = metrics.sharpe_ratio(w, mu, sigma);
         * double c = metrics.conditional_var(w, mu, sigma);
         * @endcode
         */
        class PortfolioMetrics
        {
        public:
            /// Variance at or below this is treated as a zero-risk portfolio.
            static constexpr double MIN_VARIANCE = 1e-14;

            /**
             * @param risk_free_rate Annual risk-free rate
             * @param confidence CVaR confidence level in (0, 1)
             * @throws std::invalid_argument if confidence is out of range
             */
            explicit PortfolioMetrics(double risk_free_rate = 0.043, double confidence = 0.95);

            double expected_return(const Eigen::VectorXd &weights,
                                   const Eigen::VectorXd &expected_returns) const;

            double variance(const Eigen::VectorXd &weights,
                            const Eigen::MatrixXd &covariance) const;

            double volatility(const Eigen::VectorXd &weights,
                              const Eigen::MatrixXd &covariance) const;

            /**
             * @brief (mu . w - rf) / sqrt(w' Sigma w)
             * @throws AdvisorError DEGENERATE_BASELINE if variance <= MIN_VARIANCE
             */
            double sharpe_ratio(const Eigen::VectorXd &weights,
                                const Eigen::VectorXd &expected_returns,
                                const Eigen::MatrixXd &covariance) const;

            /**
             * @brief Normal expected shortfall: -(mean - std * phi(z) / (1 - alpha)).
             *
             * Positive values are losses.
             */
            double conditional_var(const Eigen::VectorXd &weights,
                                   const Eigen::VectorXd &expected_returns,
                                   const Eigen::MatrixXd &covariance) const;

            double risk_free_rate() const { return risk_free_rate_; }
            double confidence() const { return confidence_; }

        private:
            double risk_free_rate_;
            double confidence_;
            double tail_factor_; ///< phi(z) / (1 - alpha), fixed per confidence
        };

    } // namespace analytics
} // namespace advisor

#endif // ADVISOR_ANALYTICS_PORTFOLIO_METRICS_HPP
