#pragma once

#include "decisiongate/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace decisiongate {

// Immutable input of one decision cycle. Every evaluator sees the same copy.
struct EvaluationContext {
    std::string subject;     // instrument or entity being decided on
    std::string direction;   // proposed action, e.g. "LONG"
    std::unordered_map<std::string, double> signals;
    std::unordered_map<std::string, std::string> attributes;
    Timestamp as_of{};

    std::optional<double> signal(const std::string& key) const {
        auto it = signals.find(key);
        if (it == signals.end()) return std::nullopt;
        return it->second;
    }

    std::optional<std::string> attribute(const std::string& key) const {
        auto it = attributes.find(key);
        if (it == attributes.end()) return std::nullopt;
        return it->second;
    }
};

// One evaluator's answer. approved == false is a veto.
struct Verdict {
    std::string name;
    bool approved{false};
    std::string reason;
    double confidence{0.0};   // [0, 1]

    static Verdict approve(std::string name, double confidence, std::string reason = "") {
        return Verdict{std::move(name), true, std::move(reason), confidence};
    }

    static Verdict veto(std::string name, std::string reason, double confidence = 0.0) {
        return Verdict{std::move(name), false, std::move(reason), confidence};
    }
};

// Independent check consulted by the orchestrator. evaluate() must not
// mutate shared state; it may run concurrently with other evaluators.
// Throwing (EvaluatorFailureException or anything else) counts as a veto.
class Evaluator {
public:
    virtual ~Evaluator() = default;

    virtual std::string name() const = 0;
    virtual EvaluationPhase phase() const { return EvaluationPhase::Analysis; }
    virtual Verdict evaluate(const EvaluationContext& context) const = 0;
};

// Adapts a callable into an Evaluator
class FunctionEvaluator : public Evaluator {
public:
    using Function = std::function<Verdict(const EvaluationContext&)>;

    FunctionEvaluator(std::string name, EvaluationPhase phase, Function fn)
        : name_(std::move(name)), phase_(phase), fn_(std::move(fn)) {}

    std::string name() const override { return name_; }
    EvaluationPhase phase() const override { return phase_; }
    Verdict evaluate(const EvaluationContext& context) const override { return fn_(context); }

private:
    std::string name_;
    EvaluationPhase phase_;
    Function fn_;
};

} // namespace decisiongate
