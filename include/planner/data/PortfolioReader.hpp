#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "planner/data/Project.hpp"
#include "planner/data/ResourcePoolItem.hpp"
#include "planner/data/Task.hpp"

namespace planner {
namespace data {

struct Portfolio
{
    std::vector<ResourcePoolItem> resources;
    std::vector<Project> projects;
    std::vector<Task> tasks;
};

// Reads the iCalendar-style portfolio format:
//
//   BEGIN:VRESOURCE / VPROJECT / VTODO
//   NAME;PARAM=VALUE:value
//   END:VRESOURCE / VPROJECT / VTODO
//
// Input is validated here so the engine can assume well-formed data.
class PortfolioReader
{
public:
    explicit PortfolioReader(QString filePath);

    std::optional<Portfolio> read(QString *errorMessage = nullptr) const;

    static std::optional<Portfolio> parse(const QString &text, QString *errorMessage = nullptr);

private:
    static QString decodeText(const QString &text);

    QString m_filePath;
};

} // namespace data
} // namespace planner
