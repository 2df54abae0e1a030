#ifndef RELAY_LOG_H
#define RELAY_LOG_H

#include "relay_config.h"

#define RELAY_LOGGER_NAME "relay"

/*
 * Install the process-wide spdlog logger: colour console sink, plus a
 * rotating file sink when RELAY_LOG_FILE is set.
 */
void initLogging(const RelayConfig &cfg);

#endif /* RELAY_LOG_H */
