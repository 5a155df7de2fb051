#include "logging_categories.h"

Q_LOGGING_CATEGORY(urc_cache, "urc.cache")
Q_LOGGING_CATEGORY(urc_process, "urc.process")
Q_LOGGING_CATEGORY(urc_command, "urc.command")
Q_LOGGING_CATEGORY(urc_render, "urc.render")
Q_LOGGING_CATEGORY(urc_config, "urc.config")
