/**
 * @file linear_scorer.cpp
 * @brief Implementation of LinearScorer
 */

#include "scoring/linear_scorer.hpp"
#include "data/data_loader.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace advisor
{
    namespace scoring
    {

        LinearScorer::LinearScorer(std::vector<std::string> columns,
                                   Eigen::VectorXd coefficients,
                                   double intercept,
                                   LinkFunction link,
                                   int version)
            : columns_(std::move(columns)),
              coefficients_(std::move(coefficients)),
              intercept_(intercept),
              link_(link),
              version_(version)
        {
            if (static_cast<Eigen::Index>(columns_.size()) != coefficients_.size())
            {
                throw std::invalid_argument(
                    "Model has " + std::to_string(columns_.size()) + " columns but " +
                    std::to_string(coefficients_.size()) + " coefficients");
            }

            if (!coefficients_.allFinite() || !std::isfinite(intercept_))
            {
                throw std::invalid_argument("Model coefficients must be finite");
            }
        }

        LinearScorer LinearScorer::from_json(const nlohmann::json &j)
        {
            if (!j.is_object() || !j.contains("columns") || !j.contains("coefficients"))
            {
                throw std::invalid_argument("Model must contain 'columns' and 'coefficients'");
            }

            auto columns = j["columns"].get<std::vector<std::string>>();
            auto values = j["coefficients"].get<std::vector<double>>();

            Eigen::VectorXd coefficients(static_cast<Eigen::Index>(values.size()));
            for (size_t i = 0; i < values.size(); ++i)
            {
                coefficients(static_cast<Eigen::Index>(i)) = values[i];
            }

            std::string link_name = j.value("link", "logistic");
            LinkFunction link;
            if (link_name == "logistic")
                link = LinkFunction::LOGISTIC;
            else if (link_name == "identity")
                link = LinkFunction::IDENTITY;
            else
                throw std::invalid_argument("Unknown link function: " + link_name);

            return LinearScorer(std::move(columns), std::move(coefficients),
                                j.value("intercept", 0.0), link, j.value("version", 1));
        }

        LinearScorer LinearScorer::load(const std::string &path)
        {
            return from_json(DataLoader::load_json(path));
        }

        Eigen::VectorXd LinearScorer::score(const Eigen::MatrixXd &features,
                                            const std::vector<std::string> &columns) const
        {
            if (columns != columns_)
            {
                throw std::invalid_argument("Feature columns do not match the model columns");
            }

            if (features.cols() != coefficients_.size())
            {
                throw std::invalid_argument(
                    "Feature matrix has " + std::to_string(features.cols()) +
                    " columns, model expects " + std::to_string(coefficients_.size()));
            }

            Eigen::VectorXd linear = ((features * coefficients_).array() + intercept_).matrix();

            if (link_ == LinkFunction::IDENTITY)
            {
                return linear;
            }

            return (1.0 / (1.0 + (-linear.array()).exp())).matrix();
        }

    } // namespace scoring
} // namespace advisor
