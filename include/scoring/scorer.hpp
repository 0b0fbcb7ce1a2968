/**
 * @file scorer.hpp
 * @brief Abstract interface for the model that scores candidate features
 *
 * A scorer maps each feature row to a probability-like score. Higher is
 * better. Implementations describe the columns they were trained on so the
 * engine can reject a mismatched model before scoring.
 */

#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace advisor
{
    namespace scoring
    {

        class Scorer
        {
        public:
            virtual ~Scorer() = default;

            /**
             * @brief One score per row of `features`
             * @param features Candidates x columns matrix
             * @param columns Column names in matrix order
             */
            virtual Eigen::VectorXd score(const Eigen::MatrixXd &features,
                                          const std::vector<std::string> &columns) const = 0;

            /**
             * @brief Columns the model expects, in order
             */
            virtual std::vector<std::string> feature_columns() const = 0;

            virtual int schema_version() const = 0;

            virtual std::string get_name() const = 0;
        };

    } // namespace scoring
} // namespace advisor
