#include "bind_forward.hpp"
#include <decisiongate/decisiongate.hpp>
#include <pybind11/stl.h>

using namespace decisiongate;

// Trampoline class to allow Python subclassing of ConfidencePolicy
class PyConfidencePolicy : public ConfidencePolicy {
public:
    using ConfidencePolicy::ConfidencePolicy;

    double combine(const std::vector<Verdict>& approved) const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(double, ConfidencePolicy, combine, approved);
    }

    std::string name() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::string, ConfidencePolicy, name);
    }
};

void bind_policies(py::module_& m) {
    // --- Abstract ConfidencePolicy with trampoline ---
    py::class_<ConfidencePolicy, PyConfidencePolicy, std::shared_ptr<ConfidencePolicy>>(
            m, "ConfidencePolicy")
        .def(py::init<>())
        .def("combine", &ConfidencePolicy::combine, py::arg("approved"))
        .def("name", &ConfidencePolicy::name);

    // --- Concrete policies ---

    py::class_<WeightedAveragePolicy, ConfidencePolicy, std::shared_ptr<WeightedAveragePolicy>>(
            m, "WeightedAveragePolicy")
        .def(py::init<std::unordered_map<std::string, double>>(),
             py::arg("weights") = std::unordered_map<std::string, double>{})
        .def("combine", &WeightedAveragePolicy::combine, py::arg("approved"))
        .def("name", &WeightedAveragePolicy::name)
        .def("weight_of", &WeightedAveragePolicy::weight_of, py::arg("evaluator"));

    py::class_<MinimumConfidencePolicy, ConfidencePolicy, std::shared_ptr<MinimumConfidencePolicy>>(
            m, "MinimumConfidencePolicy")
        .def(py::init<>())
        .def("combine", &MinimumConfidencePolicy::combine, py::arg("approved"))
        .def("name", &MinimumConfidencePolicy::name);
}
