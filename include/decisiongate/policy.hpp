#pragma once

#include "decisiongate/evaluator.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace decisiongate {

// Abstract confidence policy interface
class ConfidencePolicy {
public:
    virtual ~ConfidencePolicy() = default;

    // Combine the confidences of approving verdicts into one value in [0, 1].
    // Called only when no evaluator vetoed. An empty list yields 0.
    virtual double combine(const std::vector<Verdict>& approved) const = 0;

    virtual std::string name() const = 0;
};

// Weighted mean (default). Evaluators without a configured weight weigh 1.0.
class WeightedAveragePolicy : public ConfidencePolicy {
public:
    explicit WeightedAveragePolicy(std::unordered_map<std::string, double> weights = {});

    double combine(const std::vector<Verdict>& approved) const override;
    std::string name() const override { return "WeightedAverage"; }

    double weight_of(const std::string& evaluator) const;

private:
    std::unordered_map<std::string, double> weights_;
};

// The least confident evaluator decides
class MinimumConfidencePolicy : public ConfidencePolicy {
public:
    double combine(const std::vector<Verdict>& approved) const override;
    std::string name() const override { return "MinimumConfidence"; }
};

} // namespace decisiongate
