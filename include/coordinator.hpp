// The coordinator runs every stored pattern against one chart and collects the ones that match.
// A run owns its own sandbox (and so its own Lua state); the chart is wrapped once and the same guarded view is shared by
// every pattern in the run. Nothing a pattern does can stop the others from running.
#pragma once
#include <defs.h>
#include <patternstore.hpp>
#include <sandbox.hpp>
#include <chart.hpp>
#include <vector>


struct PatternEvaluationCoordinator {
    PatternStore* store;
    SandboxConfig config;

    PatternEvaluationCoordinator(PatternStore* s, SandboxConfig c = SandboxConfig());

    PatternStore::Status evaluateAll(ChartValue context, std::vector<Pattern>& matches);
    // matches gets every matching pattern in store order (and is emptied first). StorageError only if the patterns couldn't be listed
};
