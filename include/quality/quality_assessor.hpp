/**
 * @file quality_assessor.hpp
 * @brief Reliability scoring for financial input bundles
 *
 * The assessor is a heuristic, not a statistical test. It starts from a
 * perfect score of 1.0 and subtracts independent penalties:
 *
 *     -0.2  any revenue value <= 0
 *     -0.2  any operating cash flow value <= 0
 *     -0.1  revenue coefficient of variation (stdev / mean) > 0.3
 *     -0.3  market_cap <= 0 or shares_outstanding <= 0
 *
 * Penalties stack and the result is clamped to [0, 1]. A low score is a
 * warning surfaced in the report, never a rejection.
 */

#pragma once

#include "data/financial_inputs.hpp"
#include <string>
#include <vector>

namespace valuation
{
    namespace quality
    {

        /**
         * @struct QualityAssessment
         * @brief Score, letter grade and the issues behind each deduction
         */
        struct QualityAssessment
        {
            double score = 1.0;              ///< Overall reliability in [0, 1]
            std::string grade = "A";         ///< Letter grade (A-F)
            std::vector<std::string> issues; ///< One entry per applied deduction

            /**
             * @brief Check whether the score falls below a warning threshold
             */
            bool below(double threshold) const { return score < threshold; }
        };

        /**
         * @class QualityAssessor
         * @brief Scores a FinancialInputBundle before any calculation proceeds
         *
         * Works on any bundle, including ones that would fail validation, so
         * that callers can report quality alongside a validation failure.
         *
         * Usage Example:
         * @code
         * QualityAssessor assessor;
         * auto assessment = assessor.assess(bundle);
         * if (assessment.below(0.5))
         * {
         *     std::cerr << "Warning: low data quality " << assessment.score << "\n";
         * }
         * @endcode
         *
         * Thread Safety: Stateless, safe for concurrent use
         */
        class QualityAssessor
        {
        public:
            static constexpr double NON_POSITIVE_REVENUE_PENALTY = 0.2;
            static constexpr double NON_POSITIVE_CASH_FLOW_PENALTY = 0.2;
            static constexpr double REVENUE_VOLATILITY_PENALTY = 0.1;
            static constexpr double MARKET_STRUCTURE_PENALTY = 0.3;
            static constexpr double VOLATILITY_THRESHOLD = 0.3;

            /**
             * @brief Full assessment with grade and issue list
             * @param bundle Bundle to score
             * @return QualityAssessment
             */
            QualityAssessment assess(const FinancialInputBundle &bundle) const;

            /**
             * @brief Score only
             * @param bundle Bundle to score
             * @return Score in [0, 1]
             */
            double score(const FinancialInputBundle &bundle) const;

            /**
             * @brief Score how recent the bundle is
             * @param last_updated When the data layer produced the bundle
             * @param as_of Reference time (usually the report timestamp)
             * @return 1.0 (<= 1h), 0.9 (<= 6h), 0.7 (<= 24h), 0.5 (<= 72h), else 0.3
             *
             * Bundles stamped after as_of score 1.0.
             */
            static double assess_freshness(Timestamp last_updated, Timestamp as_of);

            /**
             * @brief Letter grade for a score
             * @return "A" (>= 0.90), "B" (>= 0.75), "C" (>= 0.60), "D" (>= 0.40), else "F"
             */
            static std::string grade(double score);

            /**
             * @brief Human-readable description of a score
             */
            static std::string quality_level(double score);

            /**
             * @brief Suggested remediations for the data layer
             * @param assessment Quality assessment
             * @param freshness_score Data freshness score in [0, 1]
             * @return List of recommendations (possibly empty)
             */
            static std::vector<std::string> recommendations(
                const QualityAssessment &assessment,
                double freshness_score);

            /**
             * @brief Coefficient of variation (sample stdev / |mean|)
             * @param values Series with at least 2 entries
             * @return CV, or 0.0 if the series is too short or has zero mean
             */
            static double coefficient_of_variation(const Eigen::VectorXd &values);
        };

    } // namespace quality
} // namespace valuation
