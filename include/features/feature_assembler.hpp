/**
 * @file feature_assembler.hpp
 * @brief Builds the candidate feature matrix handed to the scorer
 */

#ifndef ADVISOR_FEATURES_FEATURE_ASSEMBLER_HPP
#define ADVISOR_FEATURES_FEATURE_ASSEMBLER_HPP

#include "analytics/marginal_utility.hpp"
#include "data/fundamentals.hpp"
#include "features/feature_schema.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace advisor
{
    namespace features
    {

        /**
         * @class FeatureAssembler
         * @brief One row per candidate, columns in schema order
         *
         * Missing or non-finite values become 0 so the matrix is always finite.
         *
         * Usage Example:
         * @code
         * FeatureAssembler assembler(FeatureSchema::default_schema());
         * Eigen::MatrixXd x = assembler.build(candidates, deltas, fundamentals, 0.09);
         * @endcode
         */
        class FeatureAssembler
        {
        public:
            /**
             * @throws std::invalid_argument if the schema names an unknown column
             */
            explicit FeatureAssembler(const FeatureSchema &schema = FeatureSchema::default_schema());

            /**
             * @brief Assemble the candidates x columns matrix; row i is candidates[i]
             */
            Eigen::MatrixXd build(const std::vector<std::string> &candidates,
                                  const analytics::MarginalMap &marginals,
                                  const FundamentalMap &fundamentals,
                                  double target_return) const;

            const FeatureSchema &schema() const { return schema_; }

            /**
             * @brief Whether a column name has a known source
             */
            static bool is_known_column(const std::string &name);

        private:
            FeatureSchema schema_;

            static double column_value(const std::string &column,
                                       const analytics::MarginalMetrics *marginal,
                                       const FundamentalRow *fundamental,
                                       double target_return);
        };

    } // namespace features
} // namespace advisor

#endif // ADVISOR_FEATURES_FEATURE_ASSEMBLER_HPP
