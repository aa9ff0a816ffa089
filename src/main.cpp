#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <optional>

#include "version.h"

#include "planner/core/AppContext.hpp"
#include "planner/core/EngineSettings.hpp"
#include "planner/data/CalendarDate.hpp"
#include "planner/data/TaskRepository.hpp"

using namespace planner;

namespace {

void printOptimization(QTextStream &out, const engine::OptimizationResult &result)
{
    out << "Critical path: " << result.criticalPath.path.join(QStringLiteral(" -> ")) << '\n';
    for (const engine::ScheduleChange &change : result.changes) {
        out << "  " << change.taskId << " (" << change.taskName << "): "
            << data::formatCalendarDate(change.originalStart) << " -> " << data::formatCalendarDate(change.newStart)
            << " (+" << change.delayDays << "d) " << change.reason << '\n';
    }
    out << "Duration: " << result.metrics.originalDuration << "d -> " << result.metrics.newDuration << "d, "
        << result.metrics.conflictsResolved << " conflicts resolved, peak overload "
        << result.metrics.resourcePeakReduced << '\n';
}

void printSummary(QTextStream &out, core::AppContext &context)
{
    for (const data::ResourcePoolItem &resource : context.resourcePool()) {
        out << "resource " << resource.id << " (" << resource.name << "): capacity " << resource.totalQuantity << '\n';
    }
    for (const data::Project &project : context.projects()) {
        out << "project " << project.id << " (" << project.name << ") " << data::statusToString(project.status) << ' '
            << data::formatCalendarDate(project.startDate) << " -> " << data::formatCalendarDate(project.endDate) << '\n';
        for (const data::ResourceRequirement &requirement : project.resourceRequirements) {
            out << "  needs " << requirement.count << " x " << requirement.resourceId;
            if (requirement.duration > 0) {
                out << " for " << requirement.duration << ' ' << data::unitToString(requirement.unit);
            }
            out << '\n';
        }
    }
    for (const data::Task &task : context.taskRepository().fetchTasks()) {
        out << "task " << task.id << " [" << data::priorityToString(task.priority) << "] " << task.projectId << ' '
            << data::formatCalendarDate(task.startDate) << " -> " << data::formatCalendarDate(task.endDate) << ' '
            << task.assignee << '\n';
    }
}

void printDependencies(QTextStream &out, const core::AppContext &context,
                       const std::optional<data::DependencyType> &type,
                       const std::optional<data::DependencyStatus> &status)
{
    const auto edges = context.dependencies();
    for (const data::DependencyEdge &edge : edges) {
        if ((type && edge.type != *type) || (status && edge.status != *status)) {
            continue;
        }
        out << "  " << edge.sourceId << " -> " << edge.targetId << " [" << data::dependencyTypeToString(edge.type)
            << ", " << data::dependencyStatusToString(edge.status) << (edge.critical ? ", critical" : "") << ']';
        if (edge.lagDays > 0) {
            out << " lag " << edge.lagDays << 'd';
        }
        out << ' ' << edge.description << '\n';
    }
    const engine::DependencyStats stats = context.dependencyStats(edges);
    out << "Dependencies: " << stats.totalDependencies << " (" << stats.criticalDependencies << " critical)\n";
    if (stats.mostDependent) {
        out << "Most dependent: " << stats.mostDependent->id << " (" << stats.mostDependent->count << ")\n";
    }
    if (stats.mostBlocking) {
        out << "Most blocking: " << stats.mostBlocking->id << " (" << stats.mostBlocking->count << ")\n";
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Portfolio Planner"));
    QCoreApplication::setApplicationName(QStringLiteral("planner-cli"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kPlannerVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Critical path, resource leveling and dependency analysis"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("portfolio"), QStringLiteral("Portfolio file to analyze."));

    const QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("Engine settings INI file."),
                                          QStringLiteral("ini"));
    const QCommandLineOption optimizeOption(QStringLiteral("optimize"),
                                            QStringLiteral("Resolve resource conflicts inside a project."),
                                            QStringLiteral("project"));
    const QCommandLineOption strategyOption(QStringLiteral("strategy"), QStringLiteral("smoothing or leveling."),
                                            QStringLiteral("strategy"));
    const QCommandLineOption summaryOption(QStringLiteral("summary"), QStringLiteral("List the loaded portfolio."));
    const QCommandLineOption dependenciesOption(QStringLiteral("dependencies"),
                                                QStringLiteral("Infer cross-project dependencies."));
    const QCommandLineOption typeOption(QStringLiteral("type"),
                                        QStringLiteral("Only list dependencies of this type, e.g. finish-to-start."),
                                        QStringLiteral("type"));
    const QCommandLineOption statusOption(QStringLiteral("status"),
                                          QStringLiteral("Only list dependencies with this status."),
                                          QStringLiteral("status"));
    const QCommandLineOption delayOption(QStringLiteral("delay"),
                                         QStringLiteral("Propagate a delay, given as project:days."),
                                         QStringLiteral("project:days"));
    const QCommandLineOption conflictsOption(QStringLiteral("conflicts"),
                                             QStringLiteral("Monthly over-allocation between two dates, from:to."),
                                             QStringLiteral("from:to"));
    parser.addOptions({ configOption, summaryOption, optimizeOption, strategyOption, dependenciesOption, typeOption,
                        statusOption, delayOption, conflictsOption });
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(1);
    }

    core::EngineSettings settings;
    if (parser.isSet(configOption)) {
        const QSettings ini(parser.value(configOption), QSettings::IniFormat);
        settings = core::EngineSettings::load(ini);
    } else {
        const QSettings stored;
        settings = core::EngineSettings::load(stored);
    }

    core::AppContext context(settings);
    QString error;
    if (!context.loadPortfolio(positional.front(), &error)) {
        err << "error: " << error << '\n';
        return 2;
    }

    if (parser.isSet(summaryOption)) {
        printSummary(out, context);
    }

    if (parser.isSet(optimizeOption)) {
        engine::Strategy strategy = settings.defaultStrategy;
        if (parser.isSet(strategyOption)) {
            const auto parsed = engine::strategyFromString(parser.value(strategyOption));
            if (!parsed) {
                err << "error: unknown strategy " << parser.value(strategyOption) << '\n';
                return 1;
            }
            strategy = *parsed;
        }
        const auto result = context.optimizeProject(parser.value(optimizeOption), strategy);
        if (!result) {
            err << "error: unknown project " << parser.value(optimizeOption) << '\n';
            return 1;
        }
        printOptimization(out, *result);
    }

    if (parser.isSet(dependenciesOption)) {
        std::optional<data::DependencyType> type;
        if (parser.isSet(typeOption)) {
            type = data::dependencyTypeFromString(parser.value(typeOption));
            if (!type) {
                err << "error: unknown dependency type " << parser.value(typeOption) << '\n';
                return 1;
            }
        }
        std::optional<data::DependencyStatus> status;
        if (parser.isSet(statusOption)) {
            status = data::dependencyStatusFromString(parser.value(statusOption));
            if (!status) {
                err << "error: unknown dependency status " << parser.value(statusOption) << '\n';
                return 1;
            }
        }
        printDependencies(out, context, type, status);
    }

    if (parser.isSet(delayOption)) {
        const QString value = parser.value(delayOption);
        const int separator = value.lastIndexOf(':');
        bool ok = false;
        const int days = separator > 0 ? value.mid(separator + 1).toInt(&ok) : 0;
        if (!ok) {
            err << "error: expected project:days, got " << value << '\n';
            return 1;
        }
        const auto impacts = context.simulateDelay(value.left(separator), days);
        for (const engine::ImpactEntry &impact : impacts) {
            out << "  " << impact.projectId << ": " << data::formatCalendarDate(impact.originalEndDate) << " -> "
                << data::formatCalendarDate(impact.newEndDate) << " (+" << impact.delayDays << "d)\n";
        }
        out << impacts.size() << " projects impacted\n";
    }

    if (parser.isSet(conflictsOption)) {
        const QStringList range = parser.value(conflictsOption).split(':');
        const QDate from = range.size() == 2 ? data::parseCalendarDate(range.at(0)) : QDate();
        const QDate to = range.size() == 2 ? data::parseCalendarDate(range.at(1)) : QDate();
        if (!from.isValid() || !to.isValid()) {
            err << "error: expected from:to dates, got " << parser.value(conflictsOption) << '\n';
            return 1;
        }
        for (const engine::ResourceConflict &conflict : context.resourceConflicts(from, to)) {
            out << "  " << conflict.period << ' ' << conflict.resourceId << ": " << conflict.allocated << '/'
                << conflict.capacity << " (+" << conflict.overallocation << ")\n";
        }
    }

    return 0;
}
