#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <vector>

#include "planner/data/DependencyEdge.hpp"
#include "planner/data/Project.hpp"

namespace planner {
namespace engine {

struct PathNode
{
    QString id;
    int duration = 0;
    int releaseOffset = 0; // earliest day the node may start
};

struct PathEdge
{
    QString from;
    QString to;
};

struct CriticalPathResult
{
    QStringList path;
    QStringList topologicalOrder;
    // Nodes left on a cycle. They are missing from every map below.
    QStringList unresolved;
    QHash<QString, int> accumulated; // earliest finish distance
    QHash<QString, QString> predecessor;
    QHash<QString, int> slack;

    bool isEmpty() const;
    bool onPath(const QString &id) const;
    int totalDuration() const;
};

// Longest path by Kahn's ordering. A node starts at max(releaseOffset, predecessor
// finishes). Nodes on a cycle end up in CriticalPathResult::unresolved.
CriticalPathResult computeCriticalPath(const std::vector<PathNode> &nodes, const std::vector<PathEdge> &edges);

// Projects weighted by their span in days, connected by the inferred edges.
CriticalPathResult projectCriticalPath(const std::vector<data::Project> &projects,
                                       const std::vector<data::DependencyEdge> &edges);

} // namespace engine
} // namespace planner
