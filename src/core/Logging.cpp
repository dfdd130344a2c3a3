#include "recurring/core/Logging.hpp"

namespace recurring {

Q_LOGGING_CATEGORY(lcSeries, "recurring.series", QtInfoMsg)
Q_LOGGING_CATEGORY(lcInstances, "recurring.instances", QtInfoMsg)
Q_LOGGING_CATEGORY(lcExpansion, "recurring.expansion", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStorage, "recurring.storage", QtInfoMsg)

} // namespace recurring
