#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(aqCore, "aeroquery.core")
Q_LOGGING_CATEGORY(aqStore, "aeroquery.store")
Q_LOGGING_CATEGORY(aqQuery, "aeroquery.query")
Q_LOGGING_CATEGORY(aqTools, "aeroquery.tools")
