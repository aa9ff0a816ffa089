#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcPlannerEngine)
Q_DECLARE_LOGGING_CATEGORY(lcPlannerData)
Q_DECLARE_LOGGING_CATEGORY(lcPlannerCore)
