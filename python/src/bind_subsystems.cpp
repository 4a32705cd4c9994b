#include "bind_forward.hpp"
#include <decisiongate/decisiongate.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace decisiongate;

void bind_subsystems(py::module_& m) {
    // HealthMonitor
    py::class_<HealthMonitor>(m, "HealthMonitor")
        .def(py::init<HealthConfig>(),
             py::arg("config") = HealthConfig{})
        .def("report_module_result", &HealthMonitor::report_module_result,
             py::arg("module"),
             py::arg("healthy"),
             py::arg("detail") = "")
        .def("system_health", &HealthMonitor::system_health)
        .def("should_activate_safe_mode", &HealthMonitor::should_activate_safe_mode)
        .def("fallback_settings", &HealthMonitor::fallback_settings,
             py::return_value_policy::reference_internal)
        .def("get_module", &HealthMonitor::get_module,
             py::arg("module"))
        .def("unhealthy_modules", &HealthMonitor::unhealthy_modules)
        .def("get_status", &HealthMonitor::get_status)
        .def("config", &HealthMonitor::config,
             py::return_value_policy::reference_internal)
        .def("forget", &HealthMonitor::forget,
             py::arg("module"))
        .def("reset", &HealthMonitor::reset)
        .def("set_monitor", &HealthMonitor::set_monitor,
             py::arg("monitor"));

    // Cache
    py::class_<Cache>(m, "Cache")
        .def(py::init<CacheConfig, std::string>(),
             py::arg("config") = CacheConfig{},
             py::arg("name") = "default")
        .def("name", &Cache::name)
        .def("get", &Cache::get,
             py::arg("key"))
        .def("set", &Cache::set,
             py::arg("key"),
             py::arg("value"),
             py::arg("ttl") = std::nullopt)
        .def("erase", &Cache::erase,
             py::arg("key"))
        .def("contains", &Cache::contains,
             py::arg("key"))
        .def("cleanup_expired", &Cache::cleanup_expired)
        .def("clear", &Cache::clear)
        .def("size", &Cache::size)
        .def("__len__", &Cache::size)
        .def("get_stats", &Cache::get_stats)
        .def("get_or_compute", &Cache::get_or_compute,
             py::arg("key"),
             py::arg("compute"),
             py::arg("ttl") = std::nullopt)
        .def("set_monitor", &Cache::set_monitor,
             py::arg("monitor"));

    // CacheManager
    py::class_<CacheManager>(m, "CacheManager")
        .def(py::init<CacheConfig>(),
             py::arg("default_config") = CacheConfig{})
        .def("get_cache", &CacheManager::get_cache,
             py::arg("name"),
             py::arg("config") = std::nullopt,
             py::return_value_policy::reference_internal)
        .def("has_cache", &CacheManager::has_cache,
             py::arg("name"))
        .def("names", &CacheManager::names)
        .def("clear_all", &CacheManager::clear_all)
        .def("cleanup_all_expired", &CacheManager::cleanup_all_expired)
        .def("get_all_stats", &CacheManager::get_all_stats)
        .def("set_monitor", &CacheManager::set_monitor,
             py::arg("monitor"));
}
