#include "bind_forward.hpp"
#include <decisiongate/decisiongate.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

using namespace decisiongate;

// ---------------------------------------------------------------------------
// bind_resilience  --  TokenBucket, RateLimiter, CircuitBreaker(Registry),
//                      ProtectedCaller
// ---------------------------------------------------------------------------
void bind_resilience(py::module_& m) {

    // ===================================================================
    // TokenBucket
    // ===================================================================
    py::class_<TokenBucket::ConsumeResult>(m, "ConsumeResult")
        .def(py::init<>())
        .def_readwrite("allowed", &TokenBucket::ConsumeResult::allowed)
        .def_readwrite("wait",    &TokenBucket::ConsumeResult::wait);

    py::class_<TokenBucket>(m, "TokenBucket")
        .def(py::init<double, double>(),
             py::arg("capacity"), py::arg("refill_rate_per_second"))
        .def("capacity",               &TokenBucket::capacity)
        .def("refill_rate_per_second", &TokenBucket::refill_rate_per_second)
        .def("consume", &TokenBucket::consume, py::arg("n") = 1.0)
        .def("peek",    &TokenBucket::peek)
        .def("time_until_available", &TokenBucket::time_until_available,
             py::arg("n"))
        .def("reset", &TokenBucket::reset);

    // ===================================================================
    // RateLimiter
    // ===================================================================
    py::class_<RateLimiter::Admission>(m, "Admission")
        .def(py::init<>())
        .def_readwrite("allowed",    &RateLimiter::Admission::allowed)
        .def_readwrite("wait",       &RateLimiter::Admission::wait)
        .def_readwrite("limit_name", &RateLimiter::Admission::limit_name);

    py::class_<RateLimiter>(m, "RateLimiter")
        .def(py::init<RateLimitConfig>(), py::arg("config") = RateLimitConfig{})
        .def("try_acquire", &RateLimiter::try_acquire,
             py::arg("weight") = 1)
        .def("acquire", &RateLimiter::acquire,
             py::arg("weight") = 1, py::arg("timeout") = std::nullopt,
             py::call_guard<py::gil_scoped_release>())
        .def("get_status",  &RateLimiter::get_status)
        .def("limit_names", &RateLimiter::limit_names)
        .def("config",      &RateLimiter::config,
             py::return_value_policy::reference_internal)
        .def("reset",       &RateLimiter::reset)
        .def("set_monitor", &RateLimiter::set_monitor, py::arg("monitor"));

    // ===================================================================
    // CircuitBreaker
    // ===================================================================
    py::class_<CircuitBreaker>(m, "CircuitBreaker")
        .def(py::init<std::string, CircuitBreakerConfig>(),
             py::arg("name"), py::arg("config") = CircuitBreakerConfig{})
        .def("name",           &CircuitBreaker::name)
        .def("config",         &CircuitBreaker::config,
             py::return_value_policy::reference_internal)
        .def("state",          &CircuitBreaker::state)
        .def("can_proceed",    &CircuitBreaker::can_proceed)
        .def("before_call",    &CircuitBreaker::before_call)
        .def("record_success", &CircuitBreaker::record_success,
             py::arg("generation") = std::nullopt)
        .def("record_failure", &CircuitBreaker::record_failure,
             py::arg("error"), py::arg("generation") = std::nullopt)
        .def("call",
             [](CircuitBreaker& self, py::function op) {
                 return self.call([&]() -> py::object { return op(); });
             },
             py::arg("op"))
        .def("get_status",  &CircuitBreaker::get_status)
        .def("reset",       &CircuitBreaker::reset)
        .def("set_monitor", &CircuitBreaker::set_monitor, py::arg("monitor"))
        .def("__repr__", [](const CircuitBreaker& b) {
            return "<CircuitBreaker name='" + b.name()
                 + "' state=" + std::string(to_string(b.state())) + ">";
        });

    py::class_<CircuitBreakerRegistry>(m, "CircuitBreakerRegistry")
        .def(py::init<CircuitBreakerConfig>(),
             py::arg("default_config") = CircuitBreakerConfig{})
        .def("get", &CircuitBreakerRegistry::get,
             py::arg("name"), py::arg("config") = std::nullopt,
             py::return_value_policy::reference_internal)
        .def("contains",       &CircuitBreakerRegistry::contains, py::arg("name"))
        .def("names",          &CircuitBreakerRegistry::names)
        .def("get_all_status", &CircuitBreakerRegistry::get_all_status)
        .def("reset_all",      &CircuitBreakerRegistry::reset_all)
        .def("set_monitor",    &CircuitBreakerRegistry::set_monitor, py::arg("monitor"));

    // ===================================================================
    // ProtectedCaller
    // ===================================================================
    py::class_<ProtectedCaller>(m, "ProtectedCaller")
        .def(py::init<RateLimiter&, CircuitBreakerRegistry&, std::optional<Duration>>(),
             py::arg("limiter"), py::arg("breakers"),
             py::arg("acquire_timeout") = std::nullopt,
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("invoke",
             [](ProtectedCaller& self, const std::string& dependency,
                RequestWeight weight, py::function op) {
                 return self.invoke(dependency, weight,
                                    [&]() -> py::object { return op(); });
             },
             py::arg("dependency"), py::arg("weight"), py::arg("op"))
        .def("try_invoke",
             [](ProtectedCaller& self, const std::string& dependency,
                RequestWeight weight, py::function op) -> py::object {
                 auto result = self.try_invoke(dependency, weight,
                                               [&]() -> py::object { return op(); });
                 if (result.ok()) {
                     return result.value();
                 }
                 return py::cast(result.error());
             },
             py::arg("dependency"), py::arg("weight"), py::arg("op"),
             "Return the operation's value, or an Error describing why it did not run or failed.");
}
