#include "planner/data/PortfolioReader.hpp"

#include <QFile>
#include <QHash>
#include <QSet>
#include <QStringList>
#include <QTextStream>

#include "planner/core/Logging.hpp"
#include "planner/data/CalendarDate.hpp"

namespace planner {
namespace data {

namespace {
QHash<QString, QString> parseParameters(const QString &parameters)
{
    QHash<QString, QString> result;
    const QStringList parts = parameters.split(';', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const int equals = part.indexOf('=');
        if (equals <= 0) {
            continue;
        }
        result.insert(part.left(equals).trimmed().toUpper(), part.mid(equals + 1).trimmed());
    }
    return result;
}

QStringList splitList(const QString &value)
{
    const QStringList parts = value.split(',', Qt::SkipEmptyParts);
    QStringList cleaned;
    cleaned.reserve(parts.size());
    for (const QString &part : parts) {
        cleaned << part.trimmed();
    }
    return cleaned;
}
} // namespace

PortfolioReader::PortfolioReader(QString filePath)
    : m_filePath(std::move(filePath))
{
}

std::optional<Portfolio> PortfolioReader::read(QString *errorMessage) const
{
    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        const QString message = QStringLiteral("cannot open %1: %2").arg(m_filePath, file.errorString());
        qCWarning(lcPlannerData) << message;
        if (errorMessage) {
            *errorMessage = message;
        }
        return std::nullopt;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    return parse(stream.readAll(), errorMessage);
}

std::optional<Portfolio> PortfolioReader::parse(const QString &text, QString *errorMessage)
{
    enum class Section {
        None,
        Resource,
        Project,
        Task
    };

    Portfolio portfolio;
    Section currentSection = Section::None;
    ResourcePoolItem currentResource;
    Project currentProject;
    Task currentTask;
    int sectionLine = 0;
    QString error;
    QSet<QString> resourceIds;
    QSet<QString> projectIds;
    QSet<QString> taskIds;

    auto fail = [&](int lineNumber, const QString &message) {
        if (error.isEmpty()) {
            error = QStringLiteral("line %1: %2").arg(lineNumber).arg(message);
        }
    };

    auto finalizeResource = [&]() {
        if (currentResource.id.isEmpty()) {
            fail(sectionLine, QStringLiteral("resource without UID"));
        } else if (resourceIds.contains(currentResource.id)) {
            fail(sectionLine, QStringLiteral("duplicate resource %1").arg(currentResource.id));
        } else if (currentResource.totalQuantity <= 0) {
            fail(sectionLine, QStringLiteral("resource %1 needs a positive capacity").arg(currentResource.id));
        }
        resourceIds.insert(currentResource.id);
        portfolio.resources.push_back(currentResource);
        currentResource = ResourcePoolItem{};
    };

    auto finalizeProject = [&]() {
        if (currentProject.id.isEmpty()) {
            fail(sectionLine, QStringLiteral("project without UID"));
        } else if (projectIds.contains(currentProject.id)) {
            fail(sectionLine, QStringLiteral("duplicate project %1").arg(currentProject.id));
        } else if (!currentProject.startDate.isValid() || !currentProject.endDate.isValid()) {
            fail(sectionLine, QStringLiteral("project %1 needs DTSTART and DTEND").arg(currentProject.id));
        } else if (currentProject.endDate < currentProject.startDate) {
            fail(sectionLine, QStringLiteral("project %1 ends before it starts").arg(currentProject.id));
        }
        projectIds.insert(currentProject.id);
        portfolio.projects.push_back(currentProject);
        currentProject = Project{};
    };

    auto finalizeTask = [&]() {
        if (currentTask.id.isEmpty()) {
            fail(sectionLine, QStringLiteral("task without UID"));
        } else if (taskIds.contains(currentTask.id)) {
            fail(sectionLine, QStringLiteral("duplicate task %1").arg(currentTask.id));
        } else if (!currentTask.startDate.isValid() || !currentTask.endDate.isValid()) {
            fail(sectionLine, QStringLiteral("task %1 needs DTSTART and DUE").arg(currentTask.id));
        } else if (currentTask.endDate < currentTask.startDate) {
            fail(sectionLine, QStringLiteral("task %1 ends before it starts").arg(currentTask.id));
        }
        taskIds.insert(currentTask.id);
        portfolio.tasks.push_back(currentTask);
        currentTask = Task{};
    };

    auto beginSection = [&](Section section, int lineNumber) {
        if (currentSection != Section::None) {
            fail(lineNumber, QStringLiteral("nested block"));
            return;
        }
        currentSection = section;
        sectionLine = lineNumber;
    };

    auto endSection = [&](Section section, int lineNumber) {
        if (currentSection != section) {
            fail(lineNumber, QStringLiteral("unbalanced END"));
            return;
        }
        switch (section) {
        case Section::Resource:
            finalizeResource();
            break;
        case Section::Project:
            finalizeProject();
            break;
        case Section::Task:
            finalizeTask();
            break;
        case Section::None:
            break;
        }
        currentSection = Section::None;
    };

    auto readInt = [&](const QString &value, int lineNumber, int &target) {
        bool ok = false;
        const int parsed = value.trimmed().toInt(&ok);
        if (!ok) {
            fail(lineNumber, QStringLiteral("expected an integer, got \"%1\"").arg(value));
            return;
        }
        target = parsed;
    };

    auto readDouble = [&](const QString &value, int lineNumber, double &target) {
        bool ok = false;
        const double parsed = value.trimmed().toDouble(&ok);
        if (!ok) {
            fail(lineNumber, QStringLiteral("expected a number, got \"%1\"").arg(value));
            return;
        }
        target = parsed;
    };

    auto readDate = [&](const QString &value, int lineNumber, QDate &target) {
        const QDate parsed = parseCalendarDate(value);
        if (!parsed.isValid()) {
            fail(lineNumber, QStringLiteral("invalid date \"%1\"").arg(value));
            return;
        }
        target = parsed;
    };

    auto handleLine = [&](const QString &line, int lineNumber) {
        if (line.trimmed().isEmpty()) {
            return;
        }
        if (line == QLatin1String("BEGIN:VPORTFOLIO") || line == QLatin1String("END:VPORTFOLIO")) {
            return;
        }
        if (line == QLatin1String("BEGIN:VRESOURCE")) {
            beginSection(Section::Resource, lineNumber);
            return;
        }
        if (line == QLatin1String("END:VRESOURCE")) {
            endSection(Section::Resource, lineNumber);
            return;
        }
        if (line == QLatin1String("BEGIN:VPROJECT")) {
            beginSection(Section::Project, lineNumber);
            return;
        }
        if (line == QLatin1String("END:VPROJECT")) {
            endSection(Section::Project, lineNumber);
            return;
        }
        if (line == QLatin1String("BEGIN:VTODO")) {
            beginSection(Section::Task, lineNumber);
            return;
        }
        if (line == QLatin1String("END:VTODO")) {
            endSection(Section::Task, lineNumber);
            return;
        }

        if (currentSection == Section::None) {
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            fail(lineNumber, QStringLiteral("malformed property line"));
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(';', 0, 0).toUpper();
        const QString parameters = property.contains(';') ? property.section(';', 1) : QString();
        const QString value = decodeText(rawValue);

        if (currentSection == Section::Resource) {
            if (name == QLatin1String("UID")) {
                currentResource.id = value.trimmed();
            } else if (name == QLatin1String("SUMMARY") || name == QLatin1String("NAME")) {
                currentResource.name = value;
            } else if (name == QLatin1String("CAPACITY")) {
                readInt(rawValue, lineNumber, currentResource.totalQuantity);
            }
            return;
        }

        if (currentSection == Section::Project) {
            if (name == QLatin1String("UID")) {
                currentProject.id = value.trimmed();
            } else if (name == QLatin1String("SUMMARY")) {
                currentProject.name = value;
            } else if (name == QLatin1String("STATUS")) {
                const auto status = statusFromString(rawValue);
                if (!status) {
                    fail(lineNumber, QStringLiteral("unknown project status \"%1\"").arg(rawValue));
                    return;
                }
                currentProject.status = *status;
            } else if (name == QLatin1String("DTSTART")) {
                readDate(rawValue, lineNumber, currentProject.startDate);
            } else if (name == QLatin1String("DTEND")) {
                readDate(rawValue, lineNumber, currentProject.endDate);
            } else if (name == QLatin1String("X-BUDGET")) {
                readDouble(rawValue, lineNumber, currentProject.budget);
            } else if (name == QLatin1String("X-ACTUAL-COST")) {
                readDouble(rawValue, lineNumber, currentProject.actualCost);
            } else if (name == QLatin1String("X-RESOURCE")) {
                const auto params = parseParameters(parameters);
                ResourceRequirement requirement;
                requirement.resourceId = value.trimmed();
                requirement.count = 1;
                if (params.contains(QStringLiteral("COUNT"))) {
                    readInt(params.value(QStringLiteral("COUNT")), lineNumber, requirement.count);
                }
                if (params.contains(QStringLiteral("DURATION"))) {
                    readInt(params.value(QStringLiteral("DURATION")), lineNumber, requirement.duration);
                }
                if (params.contains(QStringLiteral("UNIT"))) {
                    const auto unit = unitFromString(params.value(QStringLiteral("UNIT")));
                    if (!unit) {
                        fail(lineNumber, QStringLiteral("unknown duration unit"));
                        return;
                    }
                    requirement.unit = *unit;
                }
                if (requirement.resourceId.isEmpty()) {
                    fail(lineNumber, QStringLiteral("resource requirement without resource id"));
                    return;
                }
                currentProject.resourceRequirements.push_back(requirement);
            }
            return;
        }

        if (currentSection == Section::Task) {
            if (name == QLatin1String("UID")) {
                currentTask.id = value.trimmed();
            } else if (name == QLatin1String("SUMMARY")) {
                currentTask.name = value;
            } else if (name == QLatin1String("X-PROJECT")) {
                currentTask.projectId = value.trimmed();
            } else if (name == QLatin1String("DTSTART")) {
                readDate(rawValue, lineNumber, currentTask.startDate);
            } else if (name == QLatin1String("DUE")) {
                readDate(rawValue, lineNumber, currentTask.endDate);
            } else if (name == QLatin1String("X-ASSIGNEE")) {
                currentTask.assignee = value.trimmed();
            } else if (name == QLatin1String("PRIORITY")) {
                const auto priority = priorityFromString(rawValue);
                if (!priority) {
                    fail(lineNumber, QStringLiteral("unknown priority \"%1\"").arg(rawValue));
                    return;
                }
                currentTask.priority = *priority;
            } else if (name == QLatin1String("RELATED-TO")) {
                currentTask.predecessorIds << splitList(value);
            }
        }
    };

    const QStringList lines = text.split('\n');
    QString accumulator;
    int accumulatorLine = 0;
    bool hasAccumulator = false;
    for (int index = 0; index < lines.size(); ++index) {
        QString line = lines.at(index);
        if (line.endsWith('\r')) {
            line.chop(1);
        }
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator, accumulatorLine);
            }
            accumulator = line;
            accumulatorLine = index + 1;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator, accumulatorLine);
    }
    if (currentSection != Section::None) {
        fail(sectionLine, QStringLiteral("block is never closed"));
    }

    if (error.isEmpty()) {
        for (const Task &task : portfolio.tasks) {
            if (!task.projectId.isEmpty() && !projectIds.contains(task.projectId)) {
                qCWarning(lcPlannerData) << "task" << task.id << "refers to unknown project" << task.projectId;
            }
            for (const QString &predecessor : task.predecessorIds) {
                if (!taskIds.contains(predecessor)) {
                    qCWarning(lcPlannerData) << "task" << task.id << "depends on unknown task" << predecessor;
                }
            }
        }
    }

    if (!error.isEmpty()) {
        qCWarning(lcPlannerData).noquote() << "rejected portfolio:" << error;
        if (errorMessage) {
            *errorMessage = error;
        }
        return std::nullopt;
    }

    qCDebug(lcPlannerData) << "loaded" << portfolio.projects.size() << "projects,"
                           << portfolio.tasks.size() << "tasks," << portfolio.resources.size() << "resources";
    return portfolio;
}

QString PortfolioReader::decodeText(const QString &text)
{
    QString decoded = text;
    decoded.replace("\\n", "\n", Qt::CaseInsensitive);
    decoded.replace("\\,", ",");
    decoded.replace("\\;", ";");
    decoded.replace("\\\\", "\\");
    return decoded;
}

} // namespace data
} // namespace planner
