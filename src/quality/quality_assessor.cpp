/**
 * @file quality_assessor.cpp
 * @brief Implementation of financial input quality scoring
 */

#include "quality/quality_assessor.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace valuation
{
    namespace quality
    {

        QualityAssessment QualityAssessor::assess(const FinancialInputBundle &bundle) const
        {
            QualityAssessment assessment;
            double score = 1.0;

            const auto &revenue = bundle.revenue_history;
            const auto &ocf = bundle.operating_cash_flow_history;

            if (revenue.size() > 0 && (revenue.array() <= 0.0).any())
            {
                score -= NON_POSITIVE_REVENUE_PENALTY;
                assessment.issues.push_back("Revenue history contains non-positive values");
            }

            if (ocf.size() > 0 && (ocf.array() <= 0.0).any())
            {
                score -= NON_POSITIVE_CASH_FLOW_PENALTY;
                assessment.issues.push_back("Operating cash flow history contains non-positive values");
            }

            double cv = coefficient_of_variation(revenue);
            if (cv > VOLATILITY_THRESHOLD)
            {
                score -= REVENUE_VOLATILITY_PENALTY;

                std::ostringstream oss;
                oss << "Revenue history is highly volatile (coefficient of variation "
                    << std::fixed << std::setprecision(2) << cv << ")";
                assessment.issues.push_back(oss.str());
            }

            if (bundle.market_cap <= 0.0 || bundle.shares_outstanding <= 0.0)
            {
                score -= MARKET_STRUCTURE_PENALTY;
                assessment.issues.push_back("Market capitalization or shares outstanding is not positive");
            }

            assessment.score = std::clamp(score, 0.0, 1.0);
            assessment.grade = grade(assessment.score);
            return assessment;
        }

        double QualityAssessor::score(const FinancialInputBundle &bundle) const
        {
            return assess(bundle).score;
        }

        double QualityAssessor::assess_freshness(Timestamp last_updated, Timestamp as_of)
        {
            const double age_hours =
                std::chrono::duration<double, std::ratio<3600>>(as_of - last_updated).count();

            if (age_hours <= 1.0)
            {
                return 1.0;
            }
            else if (age_hours <= 6.0)
            {
                return 0.9;
            }
            else if (age_hours <= 24.0)
            {
                return 0.7;
            }
            else if (age_hours <= 72.0)
            {
                return 0.5;
            }
            return 0.3;
        }

        std::string QualityAssessor::grade(double score)
        {
            if (score >= 0.90)
            {
                return "A";
            }
            else if (score >= 0.75)
            {
                return "B";
            }
            else if (score >= 0.60)
            {
                return "C";
            }
            else if (score >= 0.40)
            {
                return "D";
            }
            return "F";
        }

        std::string QualityAssessor::quality_level(double score)
        {
            if (score >= 0.90)
            {
                return "Excellent - Data is highly reliable and complete";
            }
            else if (score >= 0.75)
            {
                return "Good - Data is reliable with minor issues";
            }
            else if (score >= 0.60)
            {
                return "Fair - Data is usable but has some quality concerns";
            }
            else if (score >= 0.40)
            {
                return "Poor - Data has significant quality issues";
            }
            return "Very Poor - Data quality is insufficient for reliable valuation";
        }

        std::vector<std::string> QualityAssessor::recommendations(
            const QualityAssessment &assessment,
            double freshness_score)
        {
            std::vector<std::string> out;

            if (freshness_score < 0.7)
            {
                out.push_back("Update data more frequently to improve freshness");
            }

            if (!assessment.issues.empty())
            {
                out.push_back("Review flagged historical series before relying on the valuation");
            }

            if (assessment.score < 0.6)
            {
                out.push_back("Consider using alternative data sources");
            }

            return out;
        }

        double QualityAssessor::coefficient_of_variation(const Eigen::VectorXd &values)
        {
            const Eigen::Index n = values.size();
            if (n < 2)
            {
                return 0.0;
            }

            const double mean = values.mean();
            if (mean == 0.0)
            {
                return 0.0;
            }

            // Sample standard deviation (Bessel's correction)
            const double variance = (values.array() - mean).square().sum() / static_cast<double>(n - 1);
            return std::sqrt(variance) / std::abs(mean);
        }

    } // namespace quality
} // namespace valuation
