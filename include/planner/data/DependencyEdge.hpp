#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

namespace planner {
namespace data {

enum class DependencyType
{
    FinishToStart,
    StartToStart,
    FinishToFinish,
};

enum class DependencyStatus
{
    Active,
    Resolved,
    Broken,
};

// Project-to-project edge. Regenerated by every dependency graph build.
struct DependencyEdge
{
    QString id;
    QString sourceId;
    QString sourceName;
    QString targetId;
    QString targetName;
    DependencyType type = DependencyType::FinishToStart;
    QString description;
    bool critical = false;
    int lagDays = 0; // gap between source end and target start for inferred finish-to-start
    DependencyStatus status = DependencyStatus::Active;
    QDateTime createdAt;
};

QString dependencyTypeToString(DependencyType type);
std::optional<DependencyType> dependencyTypeFromString(const QString &value);

QString dependencyStatusToString(DependencyStatus status);
std::optional<DependencyStatus> dependencyStatusFromString(const QString &value);

} // namespace data
} // namespace planner
