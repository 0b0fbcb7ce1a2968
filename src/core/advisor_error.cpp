/**
 * @file advisor_error.cpp
 * @brief Implementation of AdvisorError
 */

#include "core/advisor_error.hpp"

#include <utility>

namespace advisor
{

    std::string to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::INSUFFICIENT_HISTORY:
            return "InsufficientHistory";
        case ErrorCode::NO_USABLE_INSTRUMENTS:
            return "NoUsableInstruments";
        case ErrorCode::INFEASIBLE_TARGET:
            return "InfeasibleTarget";
        case ErrorCode::ILL_CONDITIONED_COVARIANCE:
            return "IllConditionedCovariance";
        case ErrorCode::DEGENERATE_BASELINE:
            return "DegenerateBaseline";
        case ErrorCode::FEATURE_DIMENSION_MISMATCH:
            return "FeatureDimensionMismatch";
        case ErrorCode::INVALID_TARGET:
            return "InvalidTarget";
        case ErrorCode::SCORER_UNAVAILABLE:
            return "ScorerUnavailable";
        }
        return "Unknown";
    }

    AdvisorError::AdvisorError(ErrorCode code,
                               const std::string &message,
                               nlohmann::json context)
        : std::runtime_error(to_string(code) + ": " + message),
          code_(code),
          context_(std::move(context))
    {
    }

    nlohmann::json AdvisorError::to_json() const
    {
        nlohmann::json j;
        j["error"] = to_string(code_);
        j["message"] = what();
        j["context"] = context_;
        return j;
    }

} // namespace advisor
