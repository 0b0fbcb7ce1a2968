/**
 * @file feature_assembler.cpp
 * @brief Implementation of FeatureAssembler
 */

#include "features/feature_assembler.hpp"

#include <cmath>
#include <stdexcept>

namespace advisor
{
    namespace features
    {

        FeatureAssembler::FeatureAssembler(const FeatureSchema &schema)
            : schema_(schema)
        {
            for (const auto &column : schema_.columns)
            {
                if (!is_known_column(column))
                {
                    throw std::invalid_argument("Unknown feature column: " + column);
                }
            }
        }

        Eigen::MatrixXd FeatureAssembler::build(const std::vector<std::string> &candidates,
                                                const analytics::MarginalMap &marginals,
                                                const FundamentalMap &fundamentals,
                                                double target_return) const
        {
            const Eigen::Index rows = static_cast<Eigen::Index>(candidates.size());
            const Eigen::Index cols = static_cast<Eigen::Index>(schema_.columns.size());

            Eigen::MatrixXd matrix = Eigen::MatrixXd::Zero(rows, cols);

            for (Eigen::Index i = 0; i < rows; ++i)
            {
                const std::string &ticker = candidates[static_cast<size_t>(i)];

                auto m_it = marginals.find(ticker);
                const analytics::MarginalMetrics *marginal =
                    (m_it != marginals.end()) ? &m_it->second : nullptr;

                auto f_it = fundamentals.find(ticker);
                const FundamentalRow *fundamental =
                    (f_it != fundamentals.end()) ? &f_it->second : nullptr;

                for (Eigen::Index j = 0; j < cols; ++j)
                {
                    double value = column_value(schema_.columns[static_cast<size_t>(j)],
                                                marginal, fundamental, target_return);
                    matrix(i, j) = std::isfinite(value) ? value : 0.0;
                }
            }

            return matrix;
        }

        bool FeatureAssembler::is_known_column(const std::string &name)
        {
            for (const auto &column : FeatureSchema::default_schema().columns)
            {
                if (column == name)
                    return true;
            }
            return false;
        }

        double FeatureAssembler::column_value(const std::string &column,
                                              const analytics::MarginalMetrics *marginal,
                                              const FundamentalRow *fundamental,
                                              double target_return)
        {
            if (column == "targetReturn")
                return target_return;

            if (column == "deltaSharpe")
                return marginal ? marginal->delta_sharpe : 0.0;
            if (column == "deltaCvar")
                return marginal ? marginal->delta_cvar : 0.0;

            if (!fundamental)
                return 0.0;

            if (column == "mom6")
                return fundamental->mom6;
            if (column == "mom12")
                return fundamental->mom12;
            if (column == "beta")
                return fundamental->beta;
            if (column == "divYield")
                return fundamental->div_yield;
            if (column == "logCap")
                return fundamental->log_cap;

            return 0.0;
        }

    } // namespace features
} // namespace advisor
