#include <catch2/catch.hpp>
#include <sandbox.hpp>
#include <guard.hpp>
#include <chart.hpp>
#include <chrono>
#include <string>


struct SandboxFixture {
    ChartContext chart;
    SandboxExecutor executor;
    GuardProxy guard;
    GuardedView view;

    SandboxFixture(SandboxConfig config = SandboxConfig()) : executor(config), guard(executor.lua), view(guard.wrap(ChartValue(chart.root()))) {
        chart.root() -> set("gender", "male");
    }

    SandboxExecutor::Outcome run(const char* script) {
        std::string diagnostic;
        return executor.run(script, view, diagnostic);
    }
};


TEST_CASE("literal true matches and literal false doesn't", "[sandbox]") {
    SandboxFixture f;
    REQUIRE(f.run("return true;") == SandboxExecutor::Matched);
    REQUIRE(f.run("return false;") == SandboxExecutor::NotMatched);
    REQUIRE(f.executor.evaluate("return true;", f.view));
    REQUIRE_FALSE(f.executor.evaluate("return false;", f.view));
}

TEST_CASE("only a literal true counts", "[sandbox]") {
    SandboxFixture f;
    REQUIRE(f.run("return 1") == SandboxExecutor::NotMatched);
    REQUIRE(f.run("return 'true'") == SandboxExecutor::NotMatched);
    REQUIRE(f.run("return {}") == SandboxExecutor::NotMatched);
    REQUIRE(f.run("return context") == SandboxExecutor::NotMatched);
    REQUIRE(f.run("local x = 1") == SandboxExecutor::NotMatched);
    REQUIRE(f.run("return nil") == SandboxExecutor::NotMatched);
}

TEST_CASE("scripts read the chart through context", "[sandbox]") {
    SandboxFixture f;
    REQUIRE(f.run("return context.gender == 'male'") == SandboxExecutor::Matched);
    REQUIRE(f.run("return chart.gender == 'female'") == SandboxExecutor::NotMatched);
}

TEST_CASE("errors are contained", "[sandbox]") {
    SandboxFixture f;
    std::string diagnostic;
    REQUIRE(f.executor.run("error('boom')", f.view, diagnostic) == SandboxExecutor::Threw);
    REQUIRE(diagnostic.find("boom") != std::string::npos);
    REQUIRE(f.executor.run("return context.palace.name == 'x'", f.view, diagnostic) == SandboxExecutor::Threw); // indexing nil
    REQUIRE(f.executor.run("return (", f.view, diagnostic) == SandboxExecutor::Threw);
    REQUIRE_FALSE(f.executor.evaluate("error('boom')", f.view));
}

TEST_CASE("runaway scripts time out", "[sandbox]") {
    SandboxConfig config;
    config.timeoutMs = 50;
    SandboxFixture f(config);
    std::string diagnostic;
    auto start = std::chrono::steady_clock::now();
    REQUIRE(f.executor.run("while true do end", f.view, diagnostic) == SandboxExecutor::TimedOut);
    REQUIRE(f.executor.run("local n = 0 repeat n = n + 1 until n < 0 return true", f.view, diagnostic) == SandboxExecutor::TimedOut);
    // megabyte-sized work inside each library call, with few VM instructions in between
    REQUIRE(f.executor.run("local s = 'x' for i = 1, 20 do s = s .. s end for i = 1, 1000000 do local t = s:upper() end return true", f.view, diagnostic) == SandboxExecutor::TimedOut);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    REQUIRE(elapsed < 2000);
    REQUIRE(f.run("return true") == SandboxExecutor::Matched); // and the next script gets a fresh budget
}

TEST_CASE("backtracking patterns can't stall the sandbox", "[sandbox]") {
    SandboxConfig config;
    config.timeoutMs = 50;
    SandboxFixture f(config);
    auto start = std::chrono::steady_clock::now();
    REQUIRE(f.run("local s = 'a' for i = 1, 11 do s = s .. s end return s:find('.-.-.-.-.-.-.-b') ~= nil") == SandboxExecutor::NotMatched);
    REQUIRE(f.run("local s = 'a' for i = 1, 11 do s = s .. s end return string.find(s, '.-.-.-.-.-.-.-b') ~= nil") == SandboxExecutor::NotMatched);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    REQUIRE(elapsed < 2000);
    REQUIRE(f.run("return string.match == nil and string.gmatch == nil and string.gsub == nil") == SandboxExecutor::Matched);
    REQUIRE(f.run("return ('x').match == nil and ('x').gsub == nil and ('x').gmatch == nil") == SandboxExecutor::Matched);
}

TEST_CASE("find searches for plain text", "[sandbox]") {
    SandboxFixture f;
    REQUIRE(f.run("local a, b = ('palace'):find('la') return a == 3 and b == 4") == SandboxExecutor::Matched);
    REQUIRE(f.run("return ('a.b'):find('.') == 2 and ('abc'):find('z') == nil") == SandboxExecutor::Matched);
    REQUIRE(f.run("return ('abcabc'):find('b', 3) == 5 and ('abc'):find('c', -1) == 3 and ('abc'):find('a', 10) == nil") == SandboxExecutor::Matched);
    REQUIRE(f.run("return string.find('紫微在命宫', '命') == 10 and ('abc'):find('') == 1") == SandboxExecutor::Matched);
}

TEST_CASE("memory is capped", "[sandbox]") {
    SandboxFixture f;
    std::string diagnostic;
    REQUIRE(f.executor.run("local s = 'x' for i = 1, 30 do s = s .. s end return true", f.view, diagnostic) == SandboxExecutor::Threw);
    REQUIRE(diagnostic.find("memory limit") != std::string::npos);
    REQUIRE(f.executor.memoryUsed <= f.executor.config.memoryLimit);
    REQUIRE(f.run("local t = {} for i = 1, 100000000 do t[i] = i end return true") != SandboxExecutor::Matched);
    REQUIRE(f.run("return true") == SandboxExecutor::Matched); // garbage from the failed runs doesn't count against the next one
    REQUIRE(f.run("local s = 'x' for i = 1, 16 do s = s .. s end return #s == 65536") == SandboxExecutor::Matched);
}

TEST_CASE("deny-listed scripts never run", "[sandbox]") {
    SandboxFixture f;
    std::string diagnostic;
    REQUIRE(f.executor.run("process.exit(1);", f.view, diagnostic) == SandboxExecutor::Rejected);
    REQUIRE(diagnostic.find("process") != std::string::npos);
    REQUIRE(f.run("os.exit(1) return true") == SandboxExecutor::Rejected);
    REQUIRE_FALSE(f.executor.evaluate("return require ~= nil", f.view));
}

TEST_CASE("the environment has no way out even without the scan", "[sandbox]") {
    SandboxConfig config;
    config.staticScan = false;
    SandboxFixture f(config);
    REQUIRE(f.run("return os == nil and io == nil and debug == nil and package == nil and jit == nil and ffi == nil") == SandboxExecutor::Matched);
    REQUIRE(f.run("return require == nil and module == nil and load == nil and loadstring == nil and loadfile == nil and dofile == nil") == SandboxExecutor::Matched);
    REQUIRE(f.run("return _G == nil and getfenv == nil and setfenv == nil and rawget == nil and newproxy == nil and collectgarbage == nil") == SandboxExecutor::Matched);
    REQUIRE(f.run("return pcall == nil and xpcall == nil and process == nil") == SandboxExecutor::Matched);
    REQUIRE(f.run("os.exit(1) return true") == SandboxExecutor::Threw);
}

TEST_CASE("the safe library is there", "[sandbox]") {
    SandboxFixture f;
    REQUIRE(f.run("return string.upper('a') == 'A' and math.max(1, 2) == 2 and table.concat({'a', 'b'}) == 'ab'") == SandboxExecutor::Matched);
    REQUIRE(f.run("local n = 0 for _, v in ipairs({1, 2, 3}) do n = n + v end return n == 6 and tostring(n) == '6'") == SandboxExecutor::Matched);
    REQUIRE(f.run("return string.rep == nil and string.dump == nil and ('x').rep == nil") == SandboxExecutor::Matched);
}

TEST_CASE("runs don't leak into each other", "[sandbox]") {
    SandboxFixture f;
    REQUIRE(f.run("leaked = true string.upper = nil return true") == SandboxExecutor::Matched);
    REQUIRE(f.run("return leaked == nil and string.upper ~= nil") == SandboxExecutor::Matched);
}

TEST_CASE("bytecode is refused", "[sandbox]") {
    SandboxFixture f;
    std::string bytecode = "\x1bLJ\x02\x00";
    std::string diagnostic;
    REQUIRE(f.executor.run(bytecode, f.view, diagnostic) == SandboxExecutor::Threw);
}

TEST_CASE("contexts from another sandbox are rejected", "[sandbox]") {
    SandboxFixture one;
    SandboxFixture two;
    std::string diagnostic;
    REQUIRE(one.executor.run("return true", two.view, diagnostic) == SandboxExecutor::Rejected);
}

TEST_CASE("log() is harmless", "[sandbox]") {
    SandboxConfig config;
    config.scriptLog = true;
    SandboxFixture f(config);
    REQUIRE(f.run("log('checking', context.gender, 1, true, context) print('\\27[2J') return true") == SandboxExecutor::Matched);
    SandboxFixture quiet;
    REQUIRE(quiet.run("log('nobody hears this') return true") == SandboxExecutor::Matched);
}

TEST_CASE("outcomes have names", "[sandbox]") {
    REQUIRE(std::string(SandboxExecutor::describe(SandboxExecutor::TimedOut)) == "timed out");
    REQUIRE(std::string(SandboxExecutor::describe(SandboxExecutor::Matched)) == "matched");
}
