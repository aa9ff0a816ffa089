#pragma once

#include <QDate>
#include <QString>
#include <optional>
#include <vector>

namespace planner {
namespace data {

enum class ProjectStatus
{
    Planning,
    Active,
    OnHold,
    Completed,
    Cancelled,
};

enum class DurationUnit
{
    Day,
    Month,
    Year,
};

struct ResourceRequirement
{
    QString resourceId;
    int count = 0;
    int duration = 0; // 0 means "for the whole project"
    DurationUnit unit = DurationUnit::Month;
};

struct Project
{
    QString id;
    QString name;
    QDate startDate;
    QDate endDate;
    ProjectStatus status = ProjectStatus::Planning;
    double budget = 0.0;
    double actualCost = 0.0;
    std::vector<ResourceRequirement> resourceRequirements;
};

int duration(const Project &project);

// Only these projects take part in dependency inference.
bool isSchedulable(const Project &project);

QString statusToString(ProjectStatus status);
std::optional<ProjectStatus> statusFromString(const QString &value);

QString unitToString(DurationUnit unit);
std::optional<DurationUnit> unitFromString(const QString &value);

} // namespace data
} // namespace planner
