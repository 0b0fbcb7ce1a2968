/**
 * @file sample_covariance.cpp
 * @brief Implementation of sample covariance estimator
 */

#include "risk/sample_covariance.hpp"
#include <stdexcept>

namespace advisor
{
    namespace risk
    {

        SampleCovariance::SampleCovariance(bool bias_correction, double annualization_factor)
            : bias_correction_(bias_correction),
              annualization_factor_(annualization_factor)
        {
            if (!(annualization_factor > 0.0))
            {
                throw std::invalid_argument(
                    "Annualization factor must be positive, got: " +
                    std::to_string(annualization_factor));
            }
        }

        Eigen::MatrixXd SampleCovariance::estimate_covariance(const Eigen::MatrixXd &returns) const
        {
            validate_returns(returns);

            const double n_obs = static_cast<double>(returns.rows());

            // Center each asset column on its own mean
            Eigen::RowVectorXd means = returns.colwise().mean();
            Eigen::MatrixXd centered = returns.rowwise() - means;

            Eigen::MatrixXd covariance = centered.transpose() * centered;
            covariance /= bias_correction_ ? (n_obs - 1.0) : n_obs;
            covariance *= annualization_factor_;

            return ensure_symmetric(covariance);
        }

        std::string SampleCovariance::get_name() const
        {
            return "SampleCovariance";
        }

    } // namespace risk
} // namespace advisor
