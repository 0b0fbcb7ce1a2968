/**
 * @file feature_schema.cpp
 * @brief Implementation of FeatureSchema
 */

#include "features/feature_schema.hpp"
#include "core/advisor_error.hpp"
#include "data/data_loader.hpp"

#include <stdexcept>

namespace advisor
{
    namespace features
    {

        FeatureSchema FeatureSchema::default_schema()
        {
            FeatureSchema schema;
            schema.version = 1;
            schema.columns = {"deltaSharpe", "deltaCvar", "mom6", "mom12",
                              "beta", "divYield", "logCap", "targetReturn"};
            return schema;
        }

        FeatureSchema FeatureSchema::from_json(const nlohmann::json &j)
        {
            FeatureSchema schema;

            if (j.is_array())
            {
                schema.version = 1;
                schema.columns = j.get<std::vector<std::string>>();
            }
            else if (j.is_object() && j.contains("columns"))
            {
                schema.version = j.value("version", 1);
                schema.columns = j["columns"].get<std::vector<std::string>>();
            }
            else
            {
                throw std::invalid_argument(
                    "Feature schema must be an array of names or an object with 'columns'");
            }

            if (schema.columns.empty())
            {
                throw std::invalid_argument("Feature schema has no columns");
            }

            return schema;
        }

        FeatureSchema FeatureSchema::load(const std::string &path)
        {
            return from_json(DataLoader::load_json(path));
        }

        nlohmann::json FeatureSchema::to_json() const
        {
            return {{"version", version}, {"columns", columns}};
        }

        void FeatureSchema::check_compatible(const FeatureSchema &other) const
        {
            if (*this == other)
                return;

            throw AdvisorError(ErrorCode::FEATURE_DIMENSION_MISMATCH,
                               "Feature schema does not match the expected column contract",
                               {{"expected", to_json()}, {"actual", other.to_json()}});
        }

        void FeatureSchema::check_dimension(long cols) const
        {
            if (cols == static_cast<long>(columns.size()))
                return;

            throw AdvisorError(ErrorCode::FEATURE_DIMENSION_MISMATCH,
                               "Feature matrix has " + std::to_string(cols) +
                                   " columns, schema expects " + std::to_string(columns.size()),
                               {{"expected_columns", columns.size()},
                                {"actual_columns", cols},
                                {"schema_version", version}});
        }

        bool FeatureSchema::operator==(const FeatureSchema &other) const
        {
            return version == other.version && columns == other.columns;
        }

    } // namespace features
} // namespace advisor
