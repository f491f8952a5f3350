#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for fixi_hooks

#include <cstdint>

namespace fixi_hooks {

// IDs
struct HandlerId;

// Registration
struct HandlerBinding;
class HandlerList;
class HookTable;
struct PluginRecord;
class PluginRegistry;

// Dispatch support
class ReentranceGuard;
struct ErrorEntry;
class ErrorQueue;
struct DeferredEntry;
struct QueueStats;
class DeferredEventQueue;
class TaskQueue;

// Core types
struct DispatcherState;
class Dispatcher;

} // namespace fixi_hooks
