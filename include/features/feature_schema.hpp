/**
 * @file feature_schema.hpp
 * @brief Versioned column contract between the feature matrix and the scorer
 */

#ifndef ADVISOR_FEATURES_FEATURE_SCHEMA_HPP
#define ADVISOR_FEATURES_FEATURE_SCHEMA_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace advisor
{
    namespace features
    {

        /**
         * @struct FeatureSchema
         * @brief Ordered feature column names plus a version number
         *
         * The built-in schema (version 1) is
         * [deltaSharpe, deltaCvar, mom6, mom12, beta, divYield, logCap, targetReturn].
         */
        struct FeatureSchema
        {
            int version = 1;
            std::vector<std::string> columns;

            static FeatureSchema default_schema();

            /**
             * @brief Parse a JSON array of names or a {version, columns} object
             * @throws std::invalid_argument if the JSON has neither shape
             */
            static FeatureSchema from_json(const nlohmann::json &j);

            /**
             * @brief Load from a JSON file
             * @throws std::runtime_error if the file cannot be read
             */
            static FeatureSchema load(const std::string &path);

            nlohmann::json to_json() const;

            size_t size() const { return columns.size(); }

            /**
             * @brief Require identical version, column count and column order
             * @throws AdvisorError FEATURE_DIMENSION_MISMATCH otherwise
             */
            void check_compatible(const FeatureSchema &other) const;

            /**
             * @brief Require a matrix width equal to the column count
             * @throws AdvisorError FEATURE_DIMENSION_MISMATCH otherwise
             */
            void check_dimension(long cols) const;

            bool operator==(const FeatureSchema &other) const;
            bool operator!=(const FeatureSchema &other) const { return !(*this == other); }
        };

    } // namespace features
} // namespace advisor

#endif // ADVISOR_FEATURES_FEATURE_SCHEMA_HPP
