/**
 * @file linear_scorer.hpp
 * @brief Generalized linear scorer loaded from a JSON model file
 *
 * Model format:
 * @code
 * {
 *   "version": 1,
 *   "columns": ["deltaSharpe", "deltaCvar", ...],
 *   "coefficients": [4.0, 2.5, ...],
 *   "intercept": -0.1,
 *   "link": "logistic"
 * }
 * @endcode
 */

#pragma once

#include "scoring/scorer.hpp"
#include <nlohmann/json.hpp>

namespace advisor
{
    namespace scoring
    {

        enum class LinkFunction
        {
            IDENTITY,
            LOGISTIC
        };

        /**
         * @class LinearScorer
         * @brief score = link(intercept + x . coefficients)
         */
        class LinearScorer : public Scorer
        {
        public:
            /**
             * @throws std::invalid_argument if columns and coefficients differ in
             *         length or a coefficient is not finite
             */
            LinearScorer(std::vector<std::string> columns,
                         Eigen::VectorXd coefficients,
                         double intercept = 0.0,
                         LinkFunction link = LinkFunction::LOGISTIC,
                         int version = 1);

            /**
             * @throws std::invalid_argument on a malformed model object
             */
            static LinearScorer from_json(const nlohmann::json &j);

            /**
             * @throws std::runtime_error if the file cannot be read
             */
            static LinearScorer load(const std::string &path);

            /**
             * @throws std::invalid_argument if `columns` differs from the model columns
             */
            Eigen::VectorXd score(const Eigen::MatrixXd &features,
                                  const std::vector<std::string> &columns) const override;

            std::vector<std::string> feature_columns() const override { return columns_; }

            int schema_version() const override { return version_; }

            std::string get_name() const override { return "LinearScorer"; }

            const Eigen::VectorXd &coefficients() const { return coefficients_; }
            double intercept() const { return intercept_; }
            LinkFunction link() const { return link_; }

        private:
            std::vector<std::string> columns_;
            Eigen::VectorXd coefficients_;
            double intercept_;
            LinkFunction link_;
            int version_;
        };

    } // namespace scoring
} // namespace advisor
