#include "planner/core/EngineSettings.hpp"

#include <QSettings>
#include <QtGlobal>

#include "planner/core/Logging.hpp"

namespace planner {
namespace core {

EngineSettings EngineSettings::load(const QSettings &settings)
{
    EngineSettings loaded;
    const int window = settings.value(QStringLiteral("engine/proximityWindowDays"), loaded.proximityWindowDays).toInt();
    loaded.proximityWindowDays = qBound(1, window, 365);
    const int padding = settings.value(QStringLiteral("engine/simulationPaddingDays"), loaded.simulationPaddingDays).toInt();
    loaded.simulationPaddingDays = qBound(0, padding, 3650);
    const int threshold = settings.value(QStringLiteral("engine/parallelThreshold"), loaded.parallelThreshold).toInt();
    loaded.parallelThreshold = qMax(0, threshold);

    const QString strategy = settings.value(QStringLiteral("engine/defaultStrategy")).toString();
    if (!strategy.isEmpty()) {
        const auto parsed = engine::strategyFromString(strategy);
        if (parsed) {
            loaded.defaultStrategy = *parsed;
        } else {
            qCWarning(lcPlannerCore) << "unknown default strategy" << strategy << "- using smoothing";
        }
    }
    return loaded;
}

void EngineSettings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("engine/proximityWindowDays"), proximityWindowDays);
    settings.setValue(QStringLiteral("engine/simulationPaddingDays"), simulationPaddingDays);
    settings.setValue(QStringLiteral("engine/parallelThreshold"), parallelThreshold);
    settings.setValue(QStringLiteral("engine/defaultStrategy"), engine::strategyToString(defaultStrategy));
}

} // namespace core
} // namespace planner
