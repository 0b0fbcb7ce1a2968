/**
 * @file recommendation_engine.cpp
 * @brief Implementation of RecommendationRequest, RecommendationResponse and RecommendationEngine
 */

#include "service/recommendation_engine.hpp"
#include "core/advisor_error.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace advisor
{
    namespace service
    {

        namespace
        {
            // Numbers, or strings holding a number; NaN for anything else
            double number_or_nan(const nlohmann::json &value)
            {
                if (value.is_number())
                    return value.get<double>();

                if (value.is_string())
                {
                    const std::string text = value.get<std::string>();
                    char *end = nullptr;
                    double parsed = std::strtod(text.c_str(), &end);
                    if (!text.empty() && end == text.c_str() + text.size())
                        return parsed;
                }
                return std::nan("");
            }
        } // anonymous namespace

        // ------------------------- Request / Response ---------------------------

        RecommendationRequest RecommendationRequest::from_json(const nlohmann::json &j)
        {
            RecommendationRequest request;

            if (!j.is_object() || !j.contains("targetReturn"))
            {
                throw AdvisorError(ErrorCode::INVALID_TARGET, "targetReturn is required");
            }

            request.target_return = number_or_nan(j["targetReturn"]);
            if (!std::isfinite(request.target_return))
            {
                throw AdvisorError(ErrorCode::INVALID_TARGET,
                                   "targetReturn must be a finite number",
                                   {{"targetReturn", j["targetReturn"]}});
            }

            if (j.contains("budget"))
            {
                double budget = number_or_nan(j["budget"]);
                request.budget = std::isfinite(budget) ? budget : 0.0;
            }

            if (j.contains("holdings") && j["holdings"].is_array())
            {
                for (const auto &item : j["holdings"])
                {
                    if (!item.is_object() || !item.contains("ticker") || !item["ticker"].is_string())
                        continue;

                    Holding holding;
                    holding.ticker = normalize_ticker(item["ticker"].get<std::string>());
                    if (holding.ticker.empty())
                        continue;

                    double shares = item.contains("shares") ? number_or_nan(item["shares"]) : 0.0;
                    double paid = item.contains("pricePaid") ? number_or_nan(item["pricePaid"]) : 0.0;
                    holding.shares = std::isfinite(shares) ? shares : 0.0;
                    holding.price_paid = std::isfinite(paid) ? paid : 0.0;

                    request.holdings.push_back(holding);
                }
            }

            return request;
        }

        std::set<std::string> RecommendationRequest::held_tickers() const
        {
            std::set<std::string> held;
            for (const auto &holding : holdings)
            {
                held.insert(holding.ticker);
            }
            return held;
        }

        nlohmann::json RecommendationResponse::to_json() const
        {
            nlohmann::json recs = nlohmann::json::array();
            for (const auto &rec : recommendations)
            {
                recs.push_back(rec.to_json());
            }
            return {{"recommendations", recs}, {"featureOrder", feature_order}};
        }

        void RecommendationResponse::print_summary(std::ostream &out) const
        {
            out << "Recommendations (" << recommendations.size() << ")\n";
            out << std::string(60, '-') << "\n";
            out << std::left << std::setw(4) << "#" << std::setw(10) << "Ticker"
                << std::right << std::setw(10) << "Score" << std::setw(12) << "Price"
                << std::setw(10) << "Shares" << "\n";

            for (size_t i = 0; i < recommendations.size(); ++i)
            {
                const auto &rec = recommendations[i];
                out << std::left << std::setw(4) << (i + 1) << std::setw(10) << rec.ticker
                    << std::right << std::fixed << std::setprecision(4) << std::setw(10) << rec.score
                    << std::setprecision(2) << std::setw(12) << rec.price
                    << std::setw(10) << rec.shares << "\n";
            }

            if (recommendations.empty())
            {
                out << "No candidates outside current holdings.\n";
            }
            out << std::string(60, '-') << "\n";
        }

        // ------------------------- Engine ---------------------------------------

        optimizer::MeanVarianceOptions RecommendationEngine::optimizer_options(const OptimizerConfig &config)
        {
            optimizer::MeanVarianceOptions options;
            options.risk_free_rate = config.risk_free_rate;
            options.tolerance = config.tolerance;
            options.max_iterations = config.max_iterations;
            options.feasibility_tolerance = config.feasibility_tolerance;
            return options;
        }

        risk::StatisticsOptions RecommendationEngine::statistics_options(const DataConfig &config)
        {
            risk::StatisticsOptions options;
            options.min_observations = config.min_observations;
            options.min_aligned_dates = config.min_aligned_dates;
            options.periods_per_year = config.periods_per_year;
            return options;
        }

        RecommendationEngine::RecommendationEngine(const AdvisorConfig &config,
                                                   std::shared_ptr<data::DataProvider> provider,
                                                   std::shared_ptr<scoring::Scorer> scorer,
                                                   const features::FeatureSchema &schema,
                                                   bool verbose)
            : config_(config),
              provider_(std::move(provider)),
              scorer_(std::move(scorer)),
              schema_(schema),
              verbose_(verbose),
              statistics_(statistics_options(config.data)),
              optimizer_(optimizer_options(config.optimizer)),
              marginal_(config.marginal.epsilon,
                        analytics::PortfolioMetrics(config.optimizer.risk_free_rate,
                                                    config.marginal.cvar_confidence),
                        analytics::donor_policy_from_string(config.marginal.donor_policy)),
              assembler_(features::FeatureSchema::default_schema()),
              ranker_(config.top_k)
        {
            if (!provider_)
                throw std::invalid_argument("RecommendationEngine requires a data provider");
            if (!scorer_)
                throw std::invalid_argument("RecommendationEngine requires a scorer");

            features::FeatureSchema::default_schema().check_compatible(schema_);

            features::FeatureSchema model_schema;
            model_schema.version = scorer_->schema_version();
            model_schema.columns = scorer_->feature_columns();
            schema_.check_compatible(model_schema);
        }

        RecommendationResponse RecommendationEngine::recommend(const RecommendationRequest &request) const
        {
            if (!std::isfinite(request.target_return))
            {
                throw AdvisorError(ErrorCode::INVALID_TARGET, "targetReturn must be a finite number");
            }

            RecommendationResponse response;
            response.feature_order = schema_.columns;

            // 1) Statistics for the universe
            std::vector<PriceSeries> series = load_series(response.dropped);
            risk::UniverseStatistics stats = statistics_.compute(series);
            for (const auto &entry : stats.dropped)
            {
                response.dropped[entry.first] = entry.second;
                if (verbose_)
                    std::cerr << "Warning: dropped " << entry.first << " (" << entry.second << ")\n";
            }
            response.universe = stats.tickers;

            if (verbose_)
                std::cerr << "Statistics: " << stats.size() << " instruments over "
                          << stats.aligned_dates.size() << " aligned weeks\n";

            // 2) Baseline weights for the target
            response.baseline = optimizer_.optimize(stats.expected_returns, stats.covariance,
                                                    request.target_return);
            response.baseline_weights = response.baseline.weights;

            // 3) Marginal utility for non-held instruments
            const std::set<std::string> held = request.held_tickers();
            analytics::MarginalMap marginals = marginal_.compute(
                response.baseline_weights, stats.expected_returns, stats.covariance,
                stats.tickers, held);

            std::vector<std::string> candidates;
            for (const auto &ticker : stats.tickers)
            {
                if (held.count(ticker) == 0 && marginals.count(ticker) > 0)
                    candidates.push_back(ticker);
            }

            if (candidates.empty())
            {
                if (verbose_)
                    std::cerr << "Every instrument in the universe is already held\n";
                return response;
            }

            // 4) Features in schema order
            FundamentalMap fundamentals = load_fundamentals(candidates, series);
            Eigen::MatrixXd features = assembler_.build(candidates, marginals, fundamentals,
                                                        request.target_return);
            schema_.check_dimension(static_cast<long>(features.cols()));

            // 5) Score and rank
            Eigen::VectorXd scores = score_candidates(features);
            response.recommendations = ranker_.rank(candidates, scores, stats.latest_prices,
                                                    request.budget);

            return response;
        }

        std::vector<PriceSeries> RecommendationEngine::load_series(std::map<std::string, std::string> &dropped) const
        {
            std::vector<PriceSeries> series;
            series.reserve(config_.data.universe.size());

            for (const auto &raw : config_.data.universe)
            {
                const std::string ticker = normalize_ticker(raw);
                if (ticker.empty())
                    continue;

                try
                {
                    series.push_back(provider_->fetch_weekly_series(ticker));
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Warning: skipping " << ticker << ": " << e.what() << "\n";
                    dropped[ticker] = e.what();
                }
            }

            return series;
        }

        FundamentalMap RecommendationEngine::load_fundamentals(const std::vector<std::string> &tickers,
                                                               const std::vector<PriceSeries> &series) const
        {
            FundamentalMap fundamentals;

            for (const auto &ticker : tickers)
            {
                auto it = std::find_if(series.begin(), series.end(),
                                       [&ticker](const PriceSeries &s)
                                       { return s.ticker() == ticker; });
                if (it == series.end())
                    continue;

                nlohmann::json overview = nlohmann::json::object();
                try
                {
                    auto fetched = provider_->fetch_overview(ticker);
                    if (fetched)
                        overview = *fetched;
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Warning: no overview for " << ticker << ": " << e.what() << "\n";
                }

                fundamentals[ticker] = FundamentalsAdapter::normalize(overview, *it);
            }

            return fundamentals;
        }

        Eigen::VectorXd RecommendationEngine::score_candidates(const Eigen::MatrixXd &features) const
        {
            Eigen::VectorXd scores;
            try
            {
                scores = scorer_->score(features, schema_.columns);
            }
            catch (const std::exception &e)
            {
                throw AdvisorError(ErrorCode::SCORER_UNAVAILABLE,
                                   std::string("Scorer failed: ") + e.what(),
                                   {{"scorer", scorer_->get_name()}});
            }

            if (scores.size() != features.rows())
            {
                throw AdvisorError(ErrorCode::SCORER_UNAVAILABLE,
                                   "Scorer returned " + std::to_string(scores.size()) +
                                       " scores for " + std::to_string(features.rows()) + " candidates",
                                   {{"scorer", scorer_->get_name()}});
            }

            if (!scores.allFinite())
            {
                throw AdvisorError(ErrorCode::SCORER_UNAVAILABLE,
                                   "Scorer returned non-finite scores",
                                   {{"scorer", scorer_->get_name()}});
            }

            return scores;
        }

    } // namespace service
} // namespace advisor
