#pragma once

// DecisionGate: Admission control and fault isolation for decision services
//
// Runs independent evaluators under a veto rule, guards outbound calls with
// rate limits and circuit breakers, memoizes lookups in a TTL-aware LRU
// cache, and degrades to conservative settings when system health drops.

// Core
#include "decisiongate/types.hpp"
#include "decisiongate/exceptions.hpp"
#include "decisiongate/result.hpp"
#include "decisiongate/config.hpp"
#include "decisiongate/monitor.hpp"

// Admission control and fault isolation
#include "decisiongate/token_bucket.hpp"
#include "decisiongate/rate_limiter.hpp"
#include "decisiongate/circuit_breaker.hpp"
#include "decisiongate/protected_caller.hpp"
#include "decisiongate/cache.hpp"
#include "decisiongate/health_monitor.hpp"

// Decision cycle
#include "decisiongate/evaluator.hpp"
#include "decisiongate/policy.hpp"
#include "decisiongate/decision_orchestrator.hpp"
