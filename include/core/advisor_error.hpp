/**
 * @file advisor_error.hpp
 * @brief Error taxonomy for the recommendation pipeline
 *
 * Every failure that terminates a recommendation request is raised as an
 * AdvisorError carrying an ErrorCode and a JSON context object describing
 * the instrument, dimension or constraint involved. Errors are never
 * retried inside the pipeline.
 */

#ifndef ADVISOR_CORE_ADVISOR_ERROR_HPP
#define ADVISOR_CORE_ADVISOR_ERROR_HPP

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace advisor
{

    /**
     * @enum ErrorCode
     * @brief Terminal failure categories of a recommendation request
     */
    enum class ErrorCode
    {
        INSUFFICIENT_HISTORY,       ///< Fewer aligned calendar dates than required
        NO_USABLE_INSTRUMENTS,      ///< Sufficiency filtering emptied the universe
        INFEASIBLE_TARGET,          ///< Target return unreachable by a long-only portfolio
        ILL_CONDITIONED_COVARIANCE, ///< Covariance not PSD or solver could not converge
        DEGENERATE_BASELINE,        ///< Baseline portfolio variance is ~0
        FEATURE_DIMENSION_MISMATCH, ///< Feature matrix does not match the column contract
        INVALID_TARGET,             ///< Target return missing or not finite
        SCORER_UNAVAILABLE          ///< Scorer failed or returned malformed output
    };

    /**
     * @brief Stable name of an error code (e.g. "InfeasibleTarget")
     */
    std::string to_string(ErrorCode code);

    /**
     * @class AdvisorError
     * @brief Exception raised for terminal pipeline failures
     *
     * Usage Example:
     * @code
     * throw AdvisorError(ErrorCode::INFEASIBLE_TARGET,
     *                    "Target return exceeds max expected return",
     *                    {{"target_return", 0.3}, {"max_return", 0.12}});
     * @endcode
     */
    class AdvisorError : public std::runtime_error
    {
    public:
        AdvisorError(ErrorCode code,
                     const std::string &message,
                     nlohmann::json context = nlohmann::json::object());

        ErrorCode code() const { return code_; }

        const nlohmann::json &context() const { return context_; }

        /**
         * @brief Serialize as {"error", "message", "context"}
         */
        nlohmann::json to_json() const;

    private:
        ErrorCode code_;
        nlohmann::json context_;
    };

} // namespace advisor

#endif // ADVISOR_CORE_ADVISOR_ERROR_HPP
