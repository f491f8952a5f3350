#pragma once

/// @file core.hpp
/// @brief Main include file for fixi_core
///
/// fixi_core holds the pieces every other module leans on:
///
/// - **Error Handling**: Result<T> with typed error kinds
/// - **Logging**: named spdlog loggers and sink configuration
/// - **Configuration**: dispatcher limits and logging settings from JSON

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include "config.hpp"
