#include "planner/data/DependencyEdge.hpp"

namespace planner {
namespace data {

QString dependencyTypeToString(DependencyType type)
{
    switch (type) {
    case DependencyType::StartToStart:
        return QStringLiteral("start-to-start");
    case DependencyType::FinishToFinish:
        return QStringLiteral("finish-to-finish");
    case DependencyType::FinishToStart:
    default:
        return QStringLiteral("finish-to-start");
    }
}

std::optional<DependencyType> dependencyTypeFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("finish-to-start")) {
        return DependencyType::FinishToStart;
    }
    if (normalized == QLatin1String("start-to-start")) {
        return DependencyType::StartToStart;
    }
    if (normalized == QLatin1String("finish-to-finish")) {
        return DependencyType::FinishToFinish;
    }
    return std::nullopt;
}

QString dependencyStatusToString(DependencyStatus status)
{
    switch (status) {
    case DependencyStatus::Resolved:
        return QStringLiteral("resolved");
    case DependencyStatus::Broken:
        return QStringLiteral("broken");
    case DependencyStatus::Active:
    default:
        return QStringLiteral("active");
    }
}

std::optional<DependencyStatus> dependencyStatusFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("active")) {
        return DependencyStatus::Active;
    }
    if (normalized == QLatin1String("resolved")) {
        return DependencyStatus::Resolved;
    }
    if (normalized == QLatin1String("broken")) {
        return DependencyStatus::Broken;
    }
    return std::nullopt;
}

} // namespace data
} // namespace planner
