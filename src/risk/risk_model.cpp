/**
 * @file risk_model.cpp
 * @brief Implementation of RiskModel base class utilities
 */

#include "risk/risk_model.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace advisor
{
    namespace risk
    {
        void RiskModel::validate_returns(const Eigen::MatrixXd &returns)
        {
            if (returns.rows() == 0 || returns.cols() == 0)
            {
                throw std::invalid_argument("Returns matrix cannot be empty.");
            }

            if (returns.rows() < 2)
            {
                throw std::invalid_argument("Not enough observations to compute risk model. Returns matrix must have at least 2 observations for covariance estimation. Received: " + std::to_string(returns.rows()));
            }

            if (!returns.allFinite())
            {
                throw std::invalid_argument("Returns matrix contains NaN or Inf values.");
            }
        }

        Eigen::MatrixXd RiskModel::ensure_symmetric(const Eigen::MatrixXd &matrix)
        {
            return 0.5 * (matrix + matrix.transpose());
        }

        double RiskModel::minimum_eigenvalue(const Eigen::MatrixXd &covariance)
        {
            if (covariance.rows() == 0 || covariance.rows() != covariance.cols())
            {
                throw std::invalid_argument("Covariance matrix must be square and non-empty");
            }

            // Eigenvalues come back in increasing order
            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance, Eigen::EigenvaluesOnly);
            if (solver.info() != Eigen::Success)
            {
                throw std::runtime_error("Eigenvalue decomposition of covariance matrix failed");
            }
            return solver.eigenvalues()(0);
        }

        bool RiskModel::is_positive_semidefinite(const Eigen::MatrixXd &covariance,
                                                 double relative_tolerance)
        {
            if (covariance.rows() == 0 || covariance.rows() != covariance.cols() ||
                !covariance.allFinite())
            {
                return false;
            }

            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance, Eigen::EigenvaluesOnly);
            if (solver.info() != Eigen::Success)
            {
                return false;
            }

            const Eigen::VectorXd &eigenvalues = solver.eigenvalues();
            double scale = std::max(1.0, eigenvalues.cwiseAbs().maxCoeff());
            return eigenvalues(0) >= -relative_tolerance * scale;
        }

        bool RiskModel::is_symmetric(const Eigen::MatrixXd &matrix, double tolerance)
        {
            if (matrix.rows() != matrix.cols())
            {
                return false;
            }
            return (matrix - matrix.transpose()).cwiseAbs().maxCoeff() <= tolerance;
        }
    } // namespace risk
} // namespace advisor
