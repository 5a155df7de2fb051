// Centralized Qt logging categories for UmlRenderCache
#pragma once

#include <QLoggingCategory>

// Cache lookups, populates and maintenance
Q_DECLARE_LOGGING_CATEGORY(urc_cache)

// Renderer process launch / completion
Q_DECLARE_LOGGING_CATEGORY(urc_process)

// Executable path and argument resolution
Q_DECLARE_LOGGING_CATEGORY(urc_command)

// Orchestrator hit/miss decisions
Q_DECLARE_LOGGING_CATEGORY(urc_render)

// Settings load/save
Q_DECLARE_LOGGING_CATEGORY(urc_config)
