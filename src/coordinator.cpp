#include <coordinator.hpp>
#include <guard.hpp>
#include <cstdio>


PatternEvaluationCoordinator::PatternEvaluationCoordinator(PatternStore* s, SandboxConfig c) : store(s), config(c) {}

PatternStore::Status PatternEvaluationCoordinator::evaluateAll(ChartValue context, std::vector<Pattern>& matches) {
    matches.clear();
    std::vector<Pattern> patterns;
    PatternStore::Status status = store -> list(patterns);
    if (status != PatternStore::OK) {
        printf(ERROR "Couldn't load patterns for evaluation.\n");
        return status;
    }
    if (patterns.size() == 0) {
        return PatternStore::OK;
    }

    // declaration order matters: the view goes first, then the guard, and the executor (which closes the state) last
    SandboxExecutor executor(config);
    if (executor.lua == NULL) {
        printf(ERROR "No sandbox available; %zu patterns were not evaluated.\n", patterns.size());
        return PatternStore::OK;
    }
    GuardProxy guard(executor.lua);
    GuardedView view = guard.wrap(context);

    for (Pattern& pattern : patterns) {
        std::string diagnostic;
        SandboxExecutor::Outcome outcome = executor.run(pattern.script, view, diagnostic, pattern.name);
        if (outcome == SandboxExecutor::Matched) {
            matches.push_back(pattern);
        }
        else if (outcome != SandboxExecutor::NotMatched) {
            printf(SANDBOX "Pattern '%s' (#%s) %s: %s\n", pattern.name.c_str(), pattern.id.c_str(), SandboxExecutor::describe(outcome), diagnostic.c_str());
        }
    }
    printf(INFO "%zu of %zu patterns matched.\n", matches.size(), patterns.size());
    return PatternStore::OK;
}
