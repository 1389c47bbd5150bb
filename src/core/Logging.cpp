#include "chronix/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcCore, "chronix.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConfig, "chronix.config", QtInfoMsg)
Q_LOGGING_CATEGORY(lcData, "chronix.data", QtInfoMsg)
