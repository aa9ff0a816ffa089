#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "planner/core/AppContext.hpp"
#include "planner/core/PlanHistory.hpp"
#include "planner/data/TaskRepository.hpp"

using namespace planner;

namespace {
data::Project makeProject(const QString &id, const QDate &start, const QDate &end)
{
    data::Project project;
    project.id = id;
    project.name = QStringLiteral("Project %1").arg(id);
    project.startDate = start;
    project.endDate = end;
    project.status = data::ProjectStatus::Active;
    return project;
}

data::Task makeTask(const QString &id, const QDate &start, const QDate &end)
{
    data::Task task;
    task.id = id;
    task.name = id;
    task.projectId = QStringLiteral("A");
    task.startDate = start;
    task.endDate = end;
    task.assignee = QStringLiteral("dev");
    return task;
}

data::Portfolio samplePortfolio()
{
    data::Portfolio portfolio;
    portfolio.resources = { data::ResourcePoolItem{ QStringLiteral("dev"), QStringLiteral("Developers"), 1 } };
    portfolio.projects = { makeProject(QStringLiteral("A"), QDate(2024, 1, 1), QDate(2024, 1, 31)),
                           makeProject(QStringLiteral("B"), QDate(2024, 2, 3), QDate(2024, 3, 31)),
                           makeProject(QStringLiteral("C"), QDate(2024, 9, 1), QDate(2024, 9, 30)) };
    portfolio.tasks = { makeTask(QStringLiteral("T1"), QDate(2024, 1, 1), QDate(2024, 1, 5)),
                        makeTask(QStringLiteral("T2"), QDate(2024, 1, 3), QDate(2024, 1, 7)) };
    return portfolio;
}
} // namespace

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void optimizesKnownProjects();
    void unknownProjectIsRejected();
    void dependenciesAreAnnotated();
    void simulatesDelays();
    void loadsPortfolioFromFile();
    void failedLoadKeepsState();
};

void AppContextTest::optimizesKnownProjects()
{
    core::AppContext context;
    context.setPortfolio(samplePortfolio());
    QCOMPARE(context.taskRepository().fetchTasks(QStringLiteral("A")).size(), static_cast<size_t>(2));

    const auto result = context.optimizeProject(QStringLiteral("A"), engine::Strategy::Smoothing);
    QVERIFY(result.has_value());
    QCOMPARE(result->changes.size(), static_cast<size_t>(1));
    QCOMPARE(result->changes.front().taskId, QStringLiteral("T1"));

    QVERIFY(context.planHistory().apply(*result, QStringLiteral("smooth A")));
    QCOMPARE(context.taskRepository().findById(QStringLiteral("T1"))->startDate, QDate(2024, 1, 3));
}

void AppContextTest::unknownProjectIsRejected()
{
    core::AppContext context;
    context.setPortfolio(samplePortfolio());

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("unknown project")));
    QVERIFY(!context.optimizeProject(QStringLiteral("Z"), engine::Strategy::Leveling));
    QVERIFY(!context.findProject(QStringLiteral("Z")));
    QVERIFY(context.simulateDelay(QStringLiteral("Z"), 3).empty());
}

void AppContextTest::dependenciesAreAnnotated()
{
    core::AppContext context;
    context.setPortfolio(samplePortfolio());

    const auto edges = context.dependencies();
    QCOMPARE(edges.size(), static_cast<size_t>(1));
    QCOMPARE(edges.front().id, QStringLiteral("dep-A-B"));
    QVERIFY(edges.front().critical);

    const engine::CriticalPathResult path = context.portfolioCriticalPath(edges);
    QCOMPARE(path.path, (QStringList{ QStringLiteral("A"), QStringLiteral("B") }));

    const engine::DependencyStats stats = context.dependencyStats(edges);
    QCOMPARE(stats.totalDependencies, 1);
    QCOMPARE(stats.criticalDependencies, 1);
    QCOMPARE(stats.mostBlocking->id, QStringLiteral("A"));
    QCOMPARE(stats.mostDependent->id, QStringLiteral("B"));
}

void AppContextTest::simulatesDelays()
{
    core::AppContext context;
    context.setPortfolio(samplePortfolio());

    const auto impacts = context.simulateDelay(QStringLiteral("A"), 4);
    QCOMPARE(impacts.size(), static_cast<size_t>(1));
    QCOMPARE(impacts.front().projectId, QStringLiteral("B"));
    QCOMPARE(impacts.front().newEndDate, QDate(2024, 4, 4));
}

void AppContextTest::loadsPortfolioFromFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("portfolio.ics"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Text));
    file.write("BEGIN:VRESOURCE\nUID:dev\nCAPACITY:2\nEND:VRESOURCE\n"
               "BEGIN:VPROJECT\nUID:A\nSTATUS:active\nDTSTART:2024-01-01\nDTEND:2024-06-30\n"
               "X-RESOURCE;COUNT=3:dev\nEND:VPROJECT\n"
               "BEGIN:VTODO\nUID:T1\nX-PROJECT:A\nDTSTART:2024-01-01\nDUE:2024-01-04\nEND:VTODO\n");
    file.close();

    core::EngineSettings settings;
    settings.parallelThreshold = 0;
    core::AppContext context(settings);
    QString error;
    QVERIFY2(context.loadPortfolio(path, &error), qPrintable(error));
    QCOMPARE(context.settings().parallelThreshold, 0);
    QCOMPARE(context.projects().size(), static_cast<size_t>(1));
    QCOMPARE(context.resourcePool().size(), static_cast<size_t>(1));
    QVERIFY(context.taskRepository().findById(QStringLiteral("T1")).has_value());

    const auto conflicts = context.resourceConflicts(QDate(2024, 1, 1), QDate(2024, 12, 1));
    QCOMPARE(conflicts.size(), static_cast<size_t>(6));
    QCOMPARE(conflicts.front().overallocation, 1);
}

void AppContextTest::failedLoadKeepsState()
{
    core::AppContext context;
    context.setPortfolio(samplePortfolio());

    QTemporaryDir dir;
    QString error;
    QVERIFY(!context.loadPortfolio(dir.filePath(QStringLiteral("missing.ics")), &error));
    QVERIFY(!error.isEmpty());
    QCOMPARE(context.projects().size(), static_cast<size_t>(3));
}

QTEST_GUILESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
