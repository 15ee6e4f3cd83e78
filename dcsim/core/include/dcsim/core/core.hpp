#pragma once

/// @defgroup core Core Library
/// @brief Simulation kernel, data-center entities, events, and types.
///
/// The core library provides the discrete-event infrastructure: the Kernel
/// with its Clock, EventQueue and EventBus, the entity arenas (requests,
/// PMs, VMs, workloads, deployments, actions), the built-in lifecycle
/// handlers and the DeploymentManager. Placement heuristics and admission
/// policies are plugged in through abstract interfaces; it has no
/// dependencies on concrete algorithms or I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Virtual time, resources and entity identifiers.

/// @defgroup core_engine Engine
/// @ingroup core
/// @brief Kernel main loop, event bus and run reports.

/// @defgroup core_events Events
/// @ingroup core
/// @brief Topics, patterns, payloads and subscribers.

/// @defgroup core_entities Entities
/// @ingroup core
/// @brief Requests, machines, workloads, deployments and actions.

/// @defgroup core_lifecycle Lifecycle
/// @ingroup core
/// @brief Built-in handlers applying entity transitions.

/// @defgroup core_deployments Deployments
/// @ingroup core
/// @brief Replica accounting and deployment state transitions.

/// @defgroup core_policies Policies
/// @ingroup core
/// @brief Pluggable allocation, admission and action interpretation.

// Convenience header for the core library
#include <dcsim/core/types.hpp>
#include <dcsim/core/error.hpp>
#include <dcsim/core/topic.hpp>
#include <dcsim/core/event.hpp>
#include <dcsim/core/trace_writer.hpp>
#include <dcsim/core/fault.hpp>

// Engine
#include <dcsim/core/clock.hpp>
#include <dcsim/core/event_queue.hpp>
#include <dcsim/core/subscriber.hpp>
#include <dcsim/core/event_bus.hpp>
#include <dcsim/core/kernel.hpp>

// Entities and lifecycle
#include <dcsim/core/entity_table.hpp>
#include <dcsim/core/entities.hpp>
#include <dcsim/core/datacenter.hpp>
#include <dcsim/core/allocator.hpp>
#include <dcsim/core/policy.hpp>
#include <dcsim/core/deployment_manager.hpp>
#include <dcsim/core/lifecycle.hpp>
#include <dcsim/core/simulation.hpp>
