/**
 * @file recommendation_engine.hpp
 * @brief Request parsing and the single-pass recommendation pipeline
 *
 * Pipeline per request:
 *   data -> statistics -> baseline optimizer -> marginal utility
 *        -> features -> scorer -> ranker
 *
 * Every stage failure is terminal and surfaces as an AdvisorError.
 */

#pragma once

#include "data/data_loader.hpp"
#include "data/data_provider.hpp"
#include "data/fundamentals.hpp"
#include "risk/return_statistics.hpp"
#include "optimizer/mean_variance_optimizer.hpp"
#include "analytics/marginal_utility.hpp"
#include "features/feature_assembler.hpp"
#include "scoring/ranker.hpp"
#include "scoring/scorer.hpp"
#include <Eigen/Dense>
#include <iostream>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace advisor
{
    namespace service
    {

        /**
         * @struct Holding
         * @brief One position the user already owns.
         */
        struct Holding
        {
            std::string ticker; ///< Trimmed, upper-cased
            double shares = 0.0;
            double price_paid = 0.0;
        };

        /**
         * @struct RecommendationRequest
         * @brief Parsed request body.
         *
         * JSON shape: {"holdings": [{"ticker", "shares", "pricePaid"}], "targetReturn", "budget"?}
         */
        struct RecommendationRequest
        {
            std::vector<Holding> holdings;
            double target_return = 0.0;
            double budget = 0.0;

            /**
             * @throws AdvisorError INVALID_TARGET if targetReturn is missing or not a finite number
             */
            static RecommendationRequest from_json(const nlohmann::json &j);

            /**
             * @brief Held tickers, deduplicated
             */
            std::set<std::string> held_tickers() const;
        };

        /**
         * @struct RecommendationResponse
         * @brief Ranked suggestions plus the feature column order used to score them.
         *
         * The baseline fields are diagnostics and are not part of the JSON body.
         */
        struct RecommendationResponse
        {
            std::vector<scoring::Recommendation> recommendations;
            std::vector<std::string> feature_order;

            std::vector<std::string> universe;          ///< Instruments that survived statistics
            Eigen::VectorXd baseline_weights;           ///< Optimizer output, universe order
            optimizer::OptimizationResult baseline;     ///< Baseline statistics
            std::map<std::string, std::string> dropped; ///< Skipped ticker -> reason

            nlohmann::json to_json() const;

            void print_summary(std::ostream &out = std::cout) const;
        };

        /**
         * @class RecommendationEngine
         * @brief Runs one request through statistics, optimization, perturbation,
         *        feature assembly, scoring and ranking.
         *
         * The engine is immutable after construction; the scorer and feature
         * schema are checked against each other once, here, before any request.
         *
         * Usage Example:
         * @code
         * auto provider = std::make_shared<data::FileDataProvider>("data-cache");
         * auto scorer = std::make_shared<scoring::LinearScorer>(scoring::LinearScorer::load(path));
         * RecommendationEngine engine(config, provider, scorer);
         * RecommendationResponse response = engine.recommend(request);
         * @endcode
         */
        class RecommendationEngine
        {
        public:
            /**
             * @throws std::invalid_argument if provider or scorer is null
             * @throws AdvisorError FEATURE_DIMENSION_MISMATCH if the schema differs
             *         from the built-in contract or from the scorer's columns
             */
            RecommendationEngine(const AdvisorConfig &config,
                                 std::shared_ptr<data::DataProvider> provider,
                                 std::shared_ptr<scoring::Scorer> scorer,
                                 const features::FeatureSchema &schema = features::FeatureSchema::default_schema(),
                                 bool verbose = false);

            /**
             * @brief Produce ranked recommendations for a request.
             *
             * Every failure is terminal; no partial result is returned.
             * @throws AdvisorError with the code of the failing stage
             */
            RecommendationResponse recommend(const RecommendationRequest &request) const;

            const AdvisorConfig &config() const { return config_; }
            const features::FeatureSchema &schema() const { return schema_; }

        private:
            AdvisorConfig config_;
            std::shared_ptr<data::DataProvider> provider_;
            std::shared_ptr<scoring::Scorer> scorer_;
            features::FeatureSchema schema_;
            bool verbose_;

            risk::ReturnStatistics statistics_;
            optimizer::MeanVarianceOptimizer optimizer_;
            analytics::MarginalUtilityEngine marginal_;
            features::FeatureAssembler assembler_;
            scoring::Ranker ranker_;

            /**
             * @brief Fetch every universe series; failures are logged and recorded in `dropped`
             */
            std::vector<PriceSeries> load_series(std::map<std::string, std::string> &dropped) const;

            FundamentalMap load_fundamentals(const std::vector<std::string> &tickers,
                                             const std::vector<PriceSeries> &series) const;

            /**
             * @throws AdvisorError SCORER_UNAVAILABLE on scorer exception, wrong
             *         length or non-finite scores
             */
            Eigen::VectorXd score_candidates(const Eigen::MatrixXd &features) const;

            static optimizer::MeanVarianceOptions optimizer_options(const OptimizerConfig &config);
            static risk::StatisticsOptions statistics_options(const DataConfig &config);
        };

    } // namespace service
} // namespace advisor
