#include <catch2/catch.hpp>
#include <coordinator.hpp>
#include <session.hpp>
#include <sqlite3.h>
#include <string>
#include <vector>
#include <cstdio>
#include <unistd.h>


static std::string tempPath() {
    static int counter = 0;
    counter ++;
    std::string path = "/tmp/chartpat-coord-" + std::to_string(getpid()) + "-" + std::to_string(counter) + ".db";
    remove(path.c_str());
    remove((path + "-wal").c_str());
    remove((path + "-shm").c_str());
    return path;
}

static void inject(const std::string& path, const char* name, const char* script) { // writes straight to the table, past every check create() does
    sqlite3* db = NULL;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    sqlite3_busy_timeout(db, 5000);
    sqlite3_stmt* stmt = NULL;
    REQUIRE(sqlite3_prepare_v2(db, "INSERT INTO patterns (name, script) VALUES (?, ?)", -1, &stmt, NULL) == SQLITE_OK);
    sqlite3_bind_text(stmt, 1, name, -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, script, -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    REQUIRE(rc == SQLITE_DONE);
}

static std::vector<std::string> names(std::vector<Pattern>& patterns) {
    std::vector<std::string> ret;
    for (Pattern& pattern : patterns) {
        ret.push_back(pattern.name);
    }
    return ret;
}


TEST_CASE("an empty store matches nothing", "[coordinator]") {
    PatternStore store(tempPath());
    PatternEvaluationCoordinator coordinator(&store);
    ChartContext chart;
    std::vector<Pattern> matches;
    matches.push_back(Pattern{ .id = "stale" });
    REQUIRE(coordinator.evaluateAll(ChartValue(chart.root()), matches) == PatternStore::OK);
    REQUIRE(matches.empty());
}

TEST_CASE("always and never", "[coordinator]") {
    PatternStore store(tempPath());
    REQUIRE(store.create("always", "return true;", "matches everything").ok());
    REQUIRE(store.create("never", "return false;").ok());
    PatternEvaluationCoordinator coordinator(&store);
    ChartContext chart;
    std::vector<Pattern> matches;
    REQUIRE(coordinator.evaluateAll(ChartValue(chart.root()), matches) == PatternStore::OK);
    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].name == "always");
    REQUIRE(matches[0].description == "matches everything");
    REQUIRE(matches[0].id != "");
}

TEST_CASE("patterns read the chart", "[coordinator]") {
    PatternStore store(tempPath());
    REQUIRE(store.create("male", "return context.gender == 'male';").ok());
    PatternEvaluationCoordinator coordinator(&store);
    std::vector<Pattern> matches;

    ChartContext male;
    male.root() -> set("gender", "male");
    REQUIRE(coordinator.evaluateAll(ChartValue(male.root()), matches) == PatternStore::OK);
    REQUIRE(matches.size() == 1);

    ChartContext female;
    female.root() -> set("gender", "female");
    REQUIRE(coordinator.evaluateAll(ChartValue(female.root()), matches) == PatternStore::OK);
    REQUIRE(matches.empty());

    REQUIRE(coordinator.evaluateAll(ChartValue(male.root()), matches) == PatternStore::OK); // charts can be evaluated again
    REQUIRE(matches.size() == 1);
}

TEST_CASE("broken patterns don't stop the rest", "[coordinator]") {
    std::string path = tempPath();
    PatternStore store(path);
    REQUIRE(store.create("first", "return true").ok());
    REQUIRE(store.create("throws", "error('nope')").ok());
    REQUIRE(store.create("loops", "while true do end").ok());
    REQUIRE(store.create("syntax", "return (").ok());
    REQUIRE(store.create("nil index", "return context.palace.stars[1] == 'x'").ok());
    REQUIRE(store.create("truthy", "return 1").ok());
    REQUIRE(store.create("last", "return context.gender == 'male'").ok());
    SandboxConfig config;
    config.timeoutMs = 50;
    PatternEvaluationCoordinator coordinator(&store, config);
    ChartContext chart;
    chart.root() -> set("gender", "male");
    std::vector<Pattern> matches;
    REQUIRE(coordinator.evaluateAll(ChartValue(chart.root()), matches) == PatternStore::OK);
    std::vector<std::string> expected = {"first", "last"};
    REQUIRE(names(matches) == expected);
}

TEST_CASE("injected hostile scripts are contained", "[coordinator]") {
    std::string path = tempPath();
    PatternStore store(path);
    REQUIRE(store.create("before", "return true").ok());
    inject(path, "legacy exit", "process.exit(1);");
    inject(path, "legacy os", "os.exit(1) return true");
    inject(path, "legacy escape", "local s = context.constructor return s ~= nil");
    REQUIRE(store.create("after", "return true").ok());

    PatternEvaluationCoordinator coordinator(&store);
    ChartContext chart;
    std::vector<Pattern> matches;
    REQUIRE(coordinator.evaluateAll(ChartValue(chart.root()), matches) == PatternStore::OK);
    std::vector<std::string> expected = {"before", "after"};
    REQUIRE(names(matches) == expected);

    SandboxConfig config;
    config.staticScan = false; // the runtime has to hold on its own
    PatternEvaluationCoordinator unscanned(&store, config);
    REQUIRE(unscanned.evaluateAll(ChartValue(chart.root()), matches) == PatternStore::OK);
    REQUIRE(names(matches) == expected);
}

TEST_CASE("patterns can't leave anything behind for the next one", "[coordinator]") {
    PatternStore store(tempPath());
    REQUIRE(store.create("writer", "shared = true context.mark = true return false").ok());
    REQUIRE(store.create("reader", "return shared == nil and context.mark == nil").ok());
    PatternEvaluationCoordinator coordinator(&store);
    ChartContext chart;
    std::vector<Pattern> matches;
    REQUIRE(coordinator.evaluateAll(ChartValue(chart.root()), matches) == PatternStore::OK);
    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].name == "reader");
    REQUIRE(chart.root() -> get("mark").isAbsent());
}

TEST_CASE("listing failures surface as storage errors", "[coordinator]") {
    std::string blocker = tempPath();
    FILE* file = fopen(blocker.c_str(), "w");
    REQUIRE(file != NULL);
    fclose(file);
    PatternStore store(blocker + "/patterns.db");
    PatternEvaluationCoordinator coordinator(&store);
    ChartContext chart;
    std::vector<Pattern> matches;
    REQUIRE(coordinator.evaluateAll(ChartValue(chart.root()), matches) == PatternStore::StorageError);
    REQUIRE(matches.empty());
    remove(blocker.c_str());
}

TEST_CASE("sessions build charts from dotted keys", "[coordinator]") {
    SandboxConfig config;
    Session session(tempPath(), config);
    REQUIRE(session.ready());
    REQUIRE(session.store.create("typed", "return context.gender == 'male' and context.palace.index == 3 and context.palace.main == true and context.palace.name == '命宫'").ok());
    session.setChartValue("gender", "male");
    session.setChartValue("palace.index", "3");
    session.setChartValue("palace.main", "true");
    session.setChartValue("palace.name", "命宫");
    std::vector<Pattern> matches;
    REQUIRE(session.evaluate(matches) == PatternStore::OK);
    REQUIRE(matches.size() == 1);
}
