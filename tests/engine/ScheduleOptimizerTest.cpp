#include <QtTest/QtTest>

#include <QRandomGenerator>
#include <atomic>

#include "planner/engine/ScheduleOptimizer.hpp"
#include "planner/engine/TaskGraph.hpp"

using namespace planner;
using namespace planner::engine;

namespace {
data::Task makeTask(const QString &id, const QDate &start, const QDate &end, const QString &assignee,
                    data::TaskPriority priority = data::TaskPriority::P1)
{
    data::Task task;
    task.id = id;
    task.name = QStringLiteral("Task %1").arg(id);
    task.projectId = QStringLiteral("P1");
    task.startDate = start;
    task.endDate = end;
    task.assignee = assignee;
    task.priority = priority;
    return task;
}

data::ResourcePoolItem resource(const QString &id, int capacity)
{
    return data::ResourcePoolItem{ id, id, capacity };
}

const data::Task *findTask(const OptimizationResult &result, const QString &id)
{
    for (const data::Task &task : result.tasks) {
        if (task.id == id) {
            return &task;
        }
    }
    return nullptr;
}

OptimizationRequest overlappingPair(Strategy strategy)
{
    OptimizationRequest request;
    request.project.id = QStringLiteral("P1");
    request.tasks = { makeTask(QStringLiteral("T1"), QDate(2024, 1, 1), QDate(2024, 1, 5), QStringLiteral("dev1")),
                      makeTask(QStringLiteral("T2"), QDate(2024, 1, 3), QDate(2024, 1, 7), QStringLiteral("dev1"),
                               data::TaskPriority::P0) };
    request.resourcePool = { resource(QStringLiteral("dev1"), 1) };
    request.strategy = strategy;
    return request;
}
} // namespace

class ScheduleOptimizerTest : public QObject
{
    Q_OBJECT

private slots:
    void emptyTaskSet();
    void strategyNames();
    void smoothingStaysInsideFloat();
    void levelingExtendsTheProject();
    void levelingResolvesAtLeastAsMuchAsSmoothing();
    void randomLevelingNeverResolvesLess();
    void lowerPriorityYieldsFirst();
    void explicitLinksProtectPredecessors();
    void smoothingSpendsTaskSlackIndependently();
    void smoothingKeepsEndAndDurations();
    void conflictFreeScheduleIsUntouched();
    void requestIsNotModified();
    void cancellationStopsEarly();
    void zeroDurationTasks();
};

void ScheduleOptimizerTest::emptyTaskSet()
{
    OptimizationRequest request;
    request.resourcePool = { resource(QStringLiteral("dev1"), 1) };

    const OptimizationResult result = ScheduleOptimizer().optimize(request);
    QVERIFY(result.tasks.empty());
    QVERIFY(result.changes.empty());
    QCOMPARE(result.metrics.originalDuration, 0);
    QCOMPARE(result.metrics.newDuration, 0);
    QCOMPARE(result.metrics.conflictsResolved, 0);
    QVERIFY(result.criticalPath.isEmpty());
}

void ScheduleOptimizerTest::strategyNames()
{
    QCOMPARE(strategyToString(Strategy::Leveling), QStringLiteral("leveling"));
    QVERIFY(strategyFromString(QStringLiteral(" Smoothing ")) == Strategy::Smoothing);
    QVERIFY(!strategyFromString(QStringLiteral("crashing")));
}

void ScheduleOptimizerTest::smoothingStaysInsideFloat()
{
    const OptimizationResult result = ScheduleOptimizer().optimize(overlappingPair(Strategy::Smoothing));

    QCOMPARE(result.criticalPath.path, QStringList{ QStringLiteral("T2") });
    QCOMPARE(result.changes.size(), static_cast<size_t>(1));
    const ScheduleChange &change = result.changes.front();
    QCOMPARE(change.taskId, QStringLiteral("T1"));
    QCOMPARE(change.taskName, QStringLiteral("Task T1"));
    QCOMPARE(change.originalStart, QDate(2024, 1, 1));
    QCOMPARE(change.newStart, QDate(2024, 1, 3));
    QCOMPARE(change.delayDays, 2);
    QCOMPARE(change.reason, QStringLiteral("Resource smoothing: moved within available float"));

    const data::Task *moved = findTask(result, QStringLiteral("T1"));
    QVERIFY(moved);
    QCOMPARE(moved->endDate, QDate(2024, 1, 7));
    QCOMPARE(findTask(result, QStringLiteral("T2"))->startDate, QDate(2024, 1, 3));

    QCOMPARE(result.metrics.originalDuration, 6);
    QCOMPARE(result.metrics.newDuration, 6);
    // Two days of float are not enough to clear the three overlapping days.
    QCOMPARE(result.metrics.conflictsResolved, 0);
    QCOMPARE(result.metrics.resourcePeakReduced, 1);
    QVERIFY(!result.cancelled);
}

void ScheduleOptimizerTest::levelingExtendsTheProject()
{
    const OptimizationResult result = ScheduleOptimizer().optimize(overlappingPair(Strategy::Leveling));

    QCOMPARE(result.changes.size(), static_cast<size_t>(1));
    QCOMPARE(result.changes.front().newStart, QDate(2024, 1, 8));
    QCOMPARE(result.changes.front().delayDays, 7);
    QCOMPARE(result.changes.front().reason, QStringLiteral("Resource leveling: moved to resolve an over-allocation"));

    const data::Task *moved = findTask(result, QStringLiteral("T1"));
    QVERIFY(moved);
    QCOMPARE(moved->endDate, QDate(2024, 1, 12));
    QCOMPARE(data::duration(*moved), 4);

    QCOMPARE(result.metrics.originalDuration, 6);
    QCOMPARE(result.metrics.newDuration, 11);
    QCOMPARE(result.metrics.conflictsResolved, 3);
}

void ScheduleOptimizerTest::levelingResolvesAtLeastAsMuchAsSmoothing()
{
    const ScheduleOptimizer optimizer;
    const OptimizationResult smoothed = optimizer.optimize(overlappingPair(Strategy::Smoothing));
    const OptimizationResult leveled = optimizer.optimize(overlappingPair(Strategy::Leveling));

    QVERIFY(leveled.metrics.conflictsResolved >= smoothed.metrics.conflictsResolved);
    QVERIFY(leveled.metrics.newDuration >= smoothed.metrics.newDuration);
}

void ScheduleOptimizerTest::randomLevelingNeverResolvesLess()
{
    QRandomGenerator random(11);
    const QDate base(2024, 1, 1);
    const ScheduleOptimizer optimizer;
    for (int round = 0; round < 60; ++round) {
        OptimizationRequest request;
        const int count = 2 + static_cast<int>(random.bounded(5));
        for (int i = 0; i < count; ++i) {
            const QDate start = base.addDays(random.bounded(10));
            const QDate end = start.addDays(random.bounded(6));
            const QString assignee = QStringLiteral("d%1").arg(random.bounded(2));
            request.tasks.push_back(makeTask(QStringLiteral("t%1").arg(i), start, end, assignee,
                                             static_cast<data::TaskPriority>(random.bounded(3))));
        }
        request.resourcePool = { resource(QStringLiteral("d0"), 1), resource(QStringLiteral("d1"), 1) };

        request.strategy = Strategy::Smoothing;
        const OptimizationResult smoothed = optimizer.optimize(request);
        request.strategy = Strategy::Leveling;
        const OptimizationResult leveled = optimizer.optimize(request);

        QVERIFY(smoothed.metrics.conflictsResolved >= 0);
        QVERIFY(leveled.metrics.conflictsResolved >= smoothed.metrics.conflictsResolved);

        // A leveled schedule never has more tasks on a resource than it can take.
        for (QDate date = earliestStart(leveled.tasks); date <= latestEnd(leveled.tasks); date = date.addDays(1)) {
            for (const data::ResourcePoolItem &item : request.resourcePool) {
                int active = 0;
                for (const data::Task &task : leveled.tasks) {
                    if (task.assignee == item.id && data::covers(task, date)) {
                        ++active;
                    }
                }
                QVERIFY(active <= item.totalQuantity);
            }
        }
    }
}

void ScheduleOptimizerTest::lowerPriorityYieldsFirst()
{
    OptimizationRequest request;
    request.tasks = { makeTask(QStringLiteral("A"), QDate(2024, 1, 1), QDate(2024, 1, 3), QStringLiteral("dev1"),
                               data::TaskPriority::P0),
                      makeTask(QStringLiteral("B"), QDate(2024, 1, 1), QDate(2024, 1, 3), QStringLiteral("dev1"),
                               data::TaskPriority::P2),
                      makeTask(QStringLiteral("C"), QDate(2024, 1, 1), QDate(2024, 1, 10), QStringLiteral("dev2"),
                               data::TaskPriority::P0) };
    request.resourcePool = { resource(QStringLiteral("dev1"), 1) };
    request.strategy = Strategy::Leveling;

    const OptimizationResult result = ScheduleOptimizer().optimize(request);
    QCOMPARE(findTask(result, QStringLiteral("A"))->startDate, QDate(2024, 1, 1));
    QCOMPARE(findTask(result, QStringLiteral("B"))->startDate, QDate(2024, 1, 4));
    QCOMPARE(result.metrics.conflictsResolved, 3);
    QCOMPARE(result.metrics.newDuration, 9);
}

void ScheduleOptimizerTest::explicitLinksProtectPredecessors()
{
    std::vector<data::Task> tasks = { makeTask(QStringLiteral("A"), QDate(2024, 1, 1), QDate(2024, 1, 5), QStringLiteral("dev1")),
                                      makeTask(QStringLiteral("B"), QDate(2024, 1, 1), QDate(2024, 1, 2), QStringLiteral("dev1")),
                                      makeTask(QStringLiteral("C"), QDate(2024, 1, 4), QDate(2024, 1, 10), QStringLiteral("dev2")) };
    tasks[2].predecessorIds << QStringLiteral("A");

    OptimizationRequest request;
    request.tasks = tasks;
    request.links = TaskGraph::linksFromTasks(tasks);
    request.resourcePool = { resource(QStringLiteral("dev1"), 1), resource(QStringLiteral("dev2"), 1) };

    const ScheduleOptimizer optimizer;
    const OptimizationResult linked = optimizer.optimize(request);
    QCOMPARE(linked.criticalPath.path, (QStringList{ QStringLiteral("A"), QStringLiteral("C") }));
    QCOMPARE(findTask(linked, QStringLiteral("A"))->startDate, QDate(2024, 1, 1));
    QCOMPARE(findTask(linked, QStringLiteral("B"))->startDate, QDate(2024, 1, 6));
    QCOMPARE(linked.metrics.newDuration, linked.metrics.originalDuration);

    // Without links every task is on its own and the first overlapping one gives way.
    request.links.clear();
    const OptimizationResult unlinked = optimizer.optimize(request);
    QCOMPARE(unlinked.criticalPath.path, QStringList{ QStringLiteral("C") });
    QCOMPARE(findTask(unlinked, QStringLiteral("A"))->startDate, QDate(2024, 1, 3));
    QCOMPARE(findTask(unlinked, QStringLiteral("B"))->startDate, QDate(2024, 1, 1));
}

void ScheduleOptimizerTest::smoothingSpendsTaskSlackIndependently()
{
    std::vector<data::Task> tasks = {
        makeTask(QStringLiteral("A"), QDate(2024, 1, 1), QDate(2024, 1, 2), QStringLiteral("dev1"), data::TaskPriority::P2),
        makeTask(QStringLiteral("B"), QDate(2024, 1, 1), QDate(2024, 1, 6), QStringLiteral("dev1"), data::TaskPriority::P0),
        makeTask(QStringLiteral("C"), QDate(2024, 1, 5), QDate(2024, 1, 6), QStringLiteral("dev2")),
        makeTask(QStringLiteral("D"), QDate(2024, 1, 1), QDate(2024, 1, 10), QStringLiteral("dev3")),
    };
    tasks[2].predecessorIds << QStringLiteral("A");

    OptimizationRequest request;
    request.tasks = tasks;
    request.links = TaskGraph::linksFromTasks(tasks);
    request.resourcePool = { resource(QStringLiteral("dev1"), 1) };

    const OptimizationResult result = ScheduleOptimizer().optimize(request);
    QCOMPARE(result.criticalPath.path, QStringList{ QStringLiteral("D") });
    QCOMPARE(result.criticalPath.slack.value(QStringLiteral("A")), 7);

    // A uses its own float and ends after its successor starts; C is not moved along.
    const data::Task *predecessor = findTask(result, QStringLiteral("A"));
    const data::Task *successor = findTask(result, QStringLiteral("C"));
    QCOMPARE(predecessor->startDate, QDate(2024, 1, 7));
    QCOMPARE(successor->startDate, QDate(2024, 1, 5));
    QVERIFY(predecessor->endDate > successor->startDate);
    QCOMPARE(result.metrics.newDuration, result.metrics.originalDuration);
}

void ScheduleOptimizerTest::smoothingKeepsEndAndDurations()
{
    QRandomGenerator random(7);
    const QDate base(2024, 3, 1);
    const ScheduleOptimizer optimizer;
    for (int round = 0; round < 30; ++round) {
        OptimizationRequest request;
        const int count = 2 + static_cast<int>(random.bounded(10));
        for (int i = 0; i < count; ++i) {
            const QDate start = base.addDays(random.bounded(20));
            const QDate end = start.addDays(random.bounded(8));
            const QString assignee = QStringLiteral("dev%1").arg(random.bounded(2));
            request.tasks.push_back(makeTask(QStringLiteral("t%1").arg(i), start, end, assignee,
                                             static_cast<data::TaskPriority>(random.bounded(3))));
        }
        request.resourcePool = { resource(QStringLiteral("dev0"), 1), resource(QStringLiteral("dev1"), 2) };

        const OptimizationResult result = optimizer.optimize(request);
        QCOMPARE(result.tasks.size(), request.tasks.size());
        QCOMPARE(latestEnd(result.tasks), latestEnd(request.tasks));
        QCOMPARE(result.metrics.newDuration, result.metrics.originalDuration);

        for (const data::Task &original : request.tasks) {
            const data::Task *adjusted = findTask(result, original.id);
            QVERIFY(adjusted);
            QCOMPARE(data::duration(*adjusted), data::duration(original));
            QVERIFY(adjusted->startDate >= original.startDate);
        }
        for (const ScheduleChange &change : result.changes) {
            QVERIFY(change.delayDays > 0);
        }
    }
}

void ScheduleOptimizerTest::conflictFreeScheduleIsUntouched()
{
    OptimizationRequest request;
    request.tasks = { makeTask(QStringLiteral("A"), QDate(2024, 1, 1), QDate(2024, 1, 3), QStringLiteral("dev1")),
                      makeTask(QStringLiteral("B"), QDate(2024, 1, 4), QDate(2024, 1, 6), QStringLiteral("dev1")) };
    request.resourcePool = { resource(QStringLiteral("dev1"), 1) };

    const ScheduleOptimizer optimizer;
    for (Strategy strategy : { Strategy::Smoothing, Strategy::Leveling }) {
        request.strategy = strategy;
        const OptimizationResult first = optimizer.optimize(request);
        QVERIFY(first.changes.empty());
        QCOMPARE(first.metrics.conflictsResolved, 0);

        request.tasks = first.tasks;
        const OptimizationResult second = optimizer.optimize(request);
        QVERIFY(second.changes.empty());
        QCOMPARE(second.metrics.newDuration, first.metrics.newDuration);
    }
}

void ScheduleOptimizerTest::requestIsNotModified()
{
    const OptimizationRequest request = overlappingPair(Strategy::Leveling);
    const QDate before = request.tasks.front().startDate;

    const OptimizationResult result = ScheduleOptimizer().optimize(request);
    QVERIFY(!result.changes.empty());
    QCOMPARE(request.tasks.front().startDate, before);
    QCOMPARE(request.tasks.front().endDate, QDate(2024, 1, 5));
}

void ScheduleOptimizerTest::cancellationStopsEarly()
{
    std::atomic_bool cancelled(true);
    ScheduleOptimizer optimizer;
    optimizer.setCancellationFlag(&cancelled);

    const OptimizationResult result = optimizer.optimize(overlappingPair(Strategy::Leveling));
    QVERIFY(result.cancelled);
    QVERIFY(result.changes.empty());
    QCOMPARE(result.tasks.size(), static_cast<size_t>(2));
}

void ScheduleOptimizerTest::zeroDurationTasks()
{
    OptimizationRequest request;
    request.tasks = { makeTask(QStringLiteral("A"), QDate(2024, 1, 1), QDate(2024, 1, 1), QStringLiteral("dev1")),
                      makeTask(QStringLiteral("B"), QDate(2024, 1, 1), QDate(2024, 1, 1), QStringLiteral("dev1")) };
    request.resourcePool = { resource(QStringLiteral("dev1"), 1) };

    const ScheduleOptimizer optimizer;
    const OptimizationResult smoothed = optimizer.optimize(request);
    QVERIFY(smoothed.changes.empty());
    QCOMPARE(smoothed.metrics.resourcePeakReduced, 1);

    request.strategy = Strategy::Leveling;
    const OptimizationResult leveled = optimizer.optimize(request);
    QCOMPARE(leveled.changes.size(), static_cast<size_t>(1));
    QCOMPARE(leveled.changes.front().taskId, QStringLiteral("B"));
    QCOMPARE(leveled.metrics.originalDuration, 0);
    QCOMPARE(leveled.metrics.newDuration, 1);
}

QTEST_GUILESS_MAIN(ScheduleOptimizerTest)
#include "ScheduleOptimizerTest.moc"
