#include "decisiongate/policy.hpp"

#include <algorithm>

namespace decisiongate {

// ========== WeightedAveragePolicy ==========

WeightedAveragePolicy::WeightedAveragePolicy(std::unordered_map<std::string, double> weights)
    : weights_(std::move(weights)) {}

double WeightedAveragePolicy::weight_of(const std::string& evaluator) const {
    auto it = weights_.find(evaluator);
    return it != weights_.end() ? it->second : 1.0;
}

double WeightedAveragePolicy::combine(const std::vector<Verdict>& approved) const {
    double weighted_sum = 0.0;
    double total_weight = 0.0;
    for (const auto& verdict : approved) {
        double w = weight_of(verdict.name);
        weighted_sum += w * verdict.confidence;
        total_weight += w;
    }
    // Only zero-weight evaluators approved: nothing to base a confidence on
    if (total_weight <= 0.0) {
        return 0.0;
    }
    return std::clamp(weighted_sum / total_weight, 0.0, 1.0);
}

// ========== MinimumConfidencePolicy ==========

double MinimumConfidencePolicy::combine(const std::vector<Verdict>& approved) const {
    if (approved.empty()) {
        return 0.0;
    }
    auto it = std::min_element(approved.begin(), approved.end(),
                               [](const Verdict& a, const Verdict& b) {
                                   return a.confidence < b.confidence;
                               });
    return it->confidence;
}

} // namespace decisiongate
