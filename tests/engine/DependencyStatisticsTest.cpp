#include <QtTest/QtTest>

#include "planner/engine/DependencyStatistics.hpp"

using namespace planner;
using namespace planner::data;
using namespace planner::engine;

namespace {
Project makeProject(const QString &id)
{
    Project project;
    project.id = id;
    project.name = QStringLiteral("Project %1").arg(id);
    return project;
}

DependencyEdge link(const QString &from, const QString &to, bool critical = false)
{
    DependencyEdge edge;
    edge.sourceId = from;
    edge.targetId = to;
    edge.critical = critical;
    return edge;
}
} // namespace

class DependencyStatisticsTest : public QObject
{
    Q_OBJECT

private slots:
    void emptyGraph();
    void countsDegrees();
    void tiesKeepFirstListedProject();
    void edgeOnlyProjectsAreCounted();
};

void DependencyStatisticsTest::emptyGraph()
{
    const DependencyStats stats = aggregateDependencyStats({ makeProject(QStringLiteral("P1")) }, {});
    QCOMPARE(stats.totalDependencies, 0);
    QCOMPARE(stats.criticalDependencies, 0);
    QVERIFY(!stats.mostDependent);
    QVERIFY(!stats.mostBlocking);
}

void DependencyStatisticsTest::countsDegrees()
{
    const std::vector<Project> projects = { makeProject(QStringLiteral("P1")), makeProject(QStringLiteral("P2")),
                                            makeProject(QStringLiteral("P3")) };
    const std::vector<DependencyEdge> edges = { link(QStringLiteral("P1"), QStringLiteral("P2"), true),
                                                link(QStringLiteral("P1"), QStringLiteral("P3")),
                                                link(QStringLiteral("P2"), QStringLiteral("P3"), true) };

    const DependencyStats stats = aggregateDependencyStats(projects, edges);
    QCOMPARE(stats.totalDependencies, 3);
    QCOMPARE(stats.criticalDependencies, 2);
    QVERIFY(stats.mostBlocking);
    QCOMPARE(stats.mostBlocking->id, QStringLiteral("P1"));
    QCOMPARE(stats.mostBlocking->name, QStringLiteral("Project P1"));
    QCOMPARE(stats.mostBlocking->count, 2);
    QVERIFY(stats.mostDependent);
    QCOMPARE(stats.mostDependent->id, QStringLiteral("P3"));
    QCOMPARE(stats.mostDependent->count, 2);
}

void DependencyStatisticsTest::tiesKeepFirstListedProject()
{
    const std::vector<Project> projects = { makeProject(QStringLiteral("P3")), makeProject(QStringLiteral("P1")),
                                            makeProject(QStringLiteral("P2")) };
    const std::vector<DependencyEdge> edges = { link(QStringLiteral("P1"), QStringLiteral("P2")),
                                                link(QStringLiteral("P3"), QStringLiteral("P1")) };

    const DependencyStats stats = aggregateDependencyStats(projects, edges);
    QCOMPARE(stats.mostBlocking->id, QStringLiteral("P3"));
    QCOMPARE(stats.mostDependent->id, QStringLiteral("P1"));
}

void DependencyStatisticsTest::edgeOnlyProjectsAreCounted()
{
    const std::vector<DependencyEdge> edges = { link(QStringLiteral("P1"), QStringLiteral("X")),
                                                link(QStringLiteral("P2"), QStringLiteral("X")) };

    const DependencyStats stats = aggregateDependencyStats({ makeProject(QStringLiteral("P1")) }, edges);
    QCOMPARE(stats.mostDependent->id, QStringLiteral("X"));
    QVERIFY(stats.mostDependent->name.isEmpty());
    QCOMPARE(stats.mostDependent->count, 2);
    QCOMPARE(stats.mostBlocking->id, QStringLiteral("P1"));
}

QTEST_GUILESS_MAIN(DependencyStatisticsTest)
#include "DependencyStatisticsTest.moc"
