#pragma once

#include "planner/engine/ScheduleOptimizer.hpp"

class QSettings;

namespace planner {
namespace core {

struct EngineSettings
{
    int proximityWindowDays = 7;
    int simulationPaddingDays = 365;
    int parallelThreshold = 64;
    engine::Strategy defaultStrategy = engine::Strategy::Smoothing;

    // Missing or out-of-range keys fall back to the defaults above.
    static EngineSettings load(const QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace planner
