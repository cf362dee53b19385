/* chartpat

    Stores user-written chart patterns (small Lua predicates) and checks them against computed charts.
    Every pattern runs in a locked-down sandbox: it sees a read-only view of the chart, a trimmed standard library, and a
    deadline. A pattern that throws, loops forever, or pokes at things it shouldn't just doesn't match.

    chartpat [-d db] [-t timeout-ms] [-v] add NAME SCRIPT [DESCRIPTION [EXAMPLES]]
    chartpat [-d db] list
    chartpat check SCRIPT
    chartpat [-d db] [-t timeout-ms] [-v] eval [-c key value]...
*/

#include <defs.h>
#include <stdio.h>
#include <string.h>
#include <stdlib.h>
#include <string>
#include <vector>
#include <session.hpp>
#include <scan.hpp>
#include <util.hpp>


struct ConfigEntry {
    std::string name;
    std::string content;
};

static void usage() {
    printf("usage: chartpat [-d db] [-t timeout-ms] [-v] COMMAND ...\n");
    printf("\tadd NAME SCRIPT [DESCRIPTION [EXAMPLES]]\tstore a new pattern\n");
    printf("\tlist\t\t\t\t\tprint every stored pattern\n");
    printf("\tcheck SCRIPT\t\t\t\trun the deny-list scan on a script\n");
    printf("\teval [-c key value]...\t\t\tbuild a chart and print the patterns it matches\n");
}

int main(int argc, char** argv) {
    std::string dbPath = DEFAULT_DB_PATH;
    SandboxConfig config;
    std::string command = "";
    std::vector<std::string> operands;
    std::vector<ConfigEntry> chart;
    bool wasConf = false;
    for (int i = 1; i < argc; i ++) {
        if (strcmp(argv[i], "-d") == 0 && i + 1 < argc) {
            i ++;
            dbPath = argv[i];
            wasConf = false;
        }
        else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            i ++;
            if (!isNumber(argv[i]) || atoi(argv[i]) <= 0) {
                printf(ERROR "Timeout must be a positive number of milliseconds, not %s\n", argv[i]);
                return 1;
            }
            config.timeoutMs = atoi(argv[i]);
            wasConf = false;
        }
        else if (strcmp(argv[i], "-v") == 0) {
            config.scriptLog = true;
        }
        else if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            i ++;
            chart.push_back(ConfigEntry{
                argv[i],
                "" });
            wasConf = true;
        }
        else if (wasConf) {
            chart[chart.size() - 1].content = argv[i];
            wasConf = false;
        }
        else if (command == "") {
            command = argv[i];
        }
        else {
            operands.push_back(argv[i]);
        }
    }

    if (command == "check") { // doesn't need a database
        if (operands.size() != 1) {
            usage();
            return 1;
        }
        const char* token = deniedToken(operands[0]);
        if (token != NULL) {
            printf(ERROR "Script contains forbidden identifier '%s'.\n", token);
            return 1;
        }
        printf(INFO "Script passes the deny-list scan.\n");
        return 0;
    }
    if (command != "add" && command != "list" && command != "eval") {
        if (command != "") {
            printf(ERROR "Unknown command %s\n", command.c_str());
        }
        usage();
        return 1;
    }

    Session session(dbPath, config);
    if (!session.ready()) {
        printf(ERROR "Couldn't open pattern database %s. Abort.\n", dbPath.c_str());
        return 1;
    }

    if (command == "add") {
        if (operands.size() < 2 || operands.size() > 4) {
            usage();
            return 1;
        }
        PatternStore::Result result = session.store.create(
            operands[0],
            operands[1],
            operands.size() > 2 ? operands[2] : "",
            operands.size() > 3 ? operands[3] : ""
        );
        if (!result.ok()) {
            printf(ERROR "%s: %s\n", PatternStore::describe(result.status), result.message.c_str());
            return 1;
        }
        printf("%s\n", result.id.c_str());
        return 0;
    }

    if (command == "list") {
        std::vector<Pattern> patterns;
        if (session.store.list(patterns) != PatternStore::OK) {
            return 1;
        }
        for (Pattern& pattern : patterns) {
            printf("\033[1m#%s %s\033[0m\n", pattern.id.c_str(), pattern.name.c_str());
            if (pattern.description != "") {
                printf("\t%s\n", pattern.description.c_str());
            }
            if (pattern.examples != "") {
                printf("\texamples: %s\n", pattern.examples.c_str());
            }
        }
        printf(INFO "%zu patterns.\n", patterns.size());
        return 0;
    }

    for (ConfigEntry& conf : chart) {
        session.setChartValue(conf.name, conf.content);
    }
    std::vector<Pattern> matches;
    if (session.evaluate(matches) != PatternStore::OK) {
        return 1;
    }
    for (Pattern& match : matches) {
        printf("\033[1;33m#%s %s\033[0m", match.id.c_str(), match.name.c_str());
        if (match.description != "") {
            printf(" - %s", match.description.c_str());
        }
        printf("\n");
    }
    return 0;
}
