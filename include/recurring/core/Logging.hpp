#pragma once

#include <QLoggingCategory>

namespace recurring {

Q_DECLARE_LOGGING_CATEGORY(lcSeries)
Q_DECLARE_LOGGING_CATEGORY(lcInstances)
Q_DECLARE_LOGGING_CATEGORY(lcExpansion)
Q_DECLARE_LOGGING_CATEGORY(lcStorage)

} // namespace recurring
