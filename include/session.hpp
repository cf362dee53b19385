// Session holds everything the command line tool sets up once at startup: the database path, sandbox settings, the store,
// the coordinator, and a chart built from -c entries.
// Sessions should not be mutated except at the start by the main function.
#pragma once
#include <defs.h>
#include <string>
#include <patternstore.hpp>
#include <coordinator.hpp>
#include <sandbox.hpp>
#include <chart.hpp>


struct Session {
    std::string dbPath;
    SandboxConfig config;
    PatternStore store;
    PatternEvaluationCoordinator coordinator;
    ChartContext chart;

    Session(std::string db, SandboxConfig c);

    bool ready(); // is the store open?

    void setChartValue(std::string key, std::string content); // "palace.name" "命宫" -> chart.palace.name = "命宫"
    // "true"/"false" become booleans and numbers become numbers; anything else stays a string

    PatternStore::Status evaluate(std::vector<Pattern>& matches); // run every pattern against the chart
};
