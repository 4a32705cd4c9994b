#include "bind_forward.hpp"
#include <decisiongate/decisiongate.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace decisiongate;

// Trampoline class to allow Python subclassing of Evaluator
class PyEvaluator : public Evaluator {
public:
    using Evaluator::Evaluator;

    std::string name() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::string, Evaluator, name);
    }

    EvaluationPhase phase() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE(EvaluationPhase, Evaluator, phase);
    }

    Verdict evaluate(const EvaluationContext& context) const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(Verdict, Evaluator, evaluate, context);
    }
};

// ---------------------------------------------------------------------------
// bind_core  --  Evaluator, FunctionEvaluator, DecisionOrchestrator
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // Evaluator
    // ===================================================================
    py::class_<Evaluator, PyEvaluator, std::shared_ptr<Evaluator>>(m, "Evaluator")
        .def(py::init<>())
        .def("name",     &Evaluator::name)
        .def("phase",    &Evaluator::phase)
        .def("evaluate", &Evaluator::evaluate, py::arg("context"));

    py::class_<FunctionEvaluator, Evaluator, std::shared_ptr<FunctionEvaluator>>(
            m, "FunctionEvaluator")
        .def(py::init<std::string, EvaluationPhase, FunctionEvaluator::Function>(),
             py::arg("name"), py::arg("phase"), py::arg("fn"));

    // ===================================================================
    // DecisionOrchestrator
    // ===================================================================
    py::class_<DecisionOrchestrator>(m, "DecisionOrchestrator")
        .def(py::init<Config>(), py::arg("config") = Config{})

        // Evaluator registry
        .def("register_evaluator",   &DecisionOrchestrator::register_evaluator,
             py::arg("evaluator"))
        .def("unregister_evaluator", &DecisionOrchestrator::unregister_evaluator,
             py::arg("name"))
        .def("evaluator_names",      &DecisionOrchestrator::evaluator_names)
        .def("evaluator_count",      &DecisionOrchestrator::evaluator_count)

        // Decision cycle
        .def("decide", &DecisionOrchestrator::decide,
             py::arg("context"),
             py::call_guard<py::gil_scoped_release>())

        // Runtime controls
        .def("set_execution_action",   &DecisionOrchestrator::set_execution_action,
             py::arg("action"))
        .def("clear_execution_action", &DecisionOrchestrator::clear_execution_action)
        .def("set_mode",   &DecisionOrchestrator::set_mode, py::arg("mode"))
        .def("mode",       &DecisionOrchestrator::mode)
        .def("set_paused", &DecisionOrchestrator::set_paused, py::arg("paused"))
        .def("is_paused",  &DecisionOrchestrator::is_paused)
        .def("set_confidence_policy",
             [](DecisionOrchestrator& self, std::shared_ptr<ConfidencePolicy> policy) {
                 // Bridge: the orchestrator owns a unique_ptr, Python holds a shared_ptr
                 struct PolicyBridge : ConfidencePolicy {
                     std::shared_ptr<ConfidencePolicy> inner;
                     PolicyBridge(std::shared_ptr<ConfidencePolicy> p) : inner(std::move(p)) {}
                     double combine(const std::vector<Verdict>& approved) const override {
                         return inner->combine(approved);
                     }
                     std::string name() const override { return inner->name(); }
                 };
                 self.set_confidence_policy(
                     std::make_unique<PolicyBridge>(std::move(policy)));
             },
             py::arg("policy"))

        // Components
        .def("breakers",     &DecisionOrchestrator::breakers,
             py::return_value_policy::reference_internal)
        .def("rate_limiter", &DecisionOrchestrator::rate_limiter,
             py::return_value_policy::reference_internal)
        .def("caches",       &DecisionOrchestrator::caches,
             py::return_value_policy::reference_internal)
        .def("cache",        &DecisionOrchestrator::cache,
             py::return_value_policy::reference_internal)
        .def("health",       &DecisionOrchestrator::health,
             py::return_value_policy::reference_internal)
        .def("caller",       &DecisionOrchestrator::caller,
             py::return_value_policy::reference_internal)

        // Queries
        .def("get_stats",            &DecisionOrchestrator::get_stats)
        .def("get_snapshot",         &DecisionOrchestrator::get_snapshot)
        .def("executions_in_flight", &DecisionOrchestrator::executions_in_flight)
        .def("config",               &DecisionOrchestrator::config,
             py::return_value_policy::reference_internal)

        // Monitoring / lifecycle
        .def("set_monitor", &DecisionOrchestrator::set_monitor, py::arg("monitor"))
        .def("start",       &DecisionOrchestrator::start)
        .def("stop",        &DecisionOrchestrator::stop,
             py::call_guard<py::gil_scoped_release>())
        .def("is_running",  &DecisionOrchestrator::is_running);
}
