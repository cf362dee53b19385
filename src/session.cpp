#include <session.hpp>
#include <util.hpp>
#include <cstdlib>
#include <cstdio>


Session::Session(std::string db, SandboxConfig c) : dbPath(db), config(c), store(db), coordinator(&store, c) {}

bool Session::ready() {
    return store.valid;
}

void Session::setChartValue(std::string key, std::string content) {
    std::string parent = "";
    std::string field = key;
    size_t dot = key.rfind('.');
    if (dot != std::string::npos) {
        parent = key.substr(0, dot);
        field = key.substr(dot + 1);
    }
    ChartObject* into = parent == "" ? chart.root() : chart.path(parent);
    if (into == NULL || field == "") {
        printf(WARNING "Can't set chart value '%s'.\n", key.c_str());
        return;
    }
    if (content == "true" || content == "false") {
        into -> set(field, ChartValue(content == "true"));
    }
    else if (isNumber(content.c_str())) {
        into -> set(field, ChartValue(strtod(content.c_str(), NULL)));
    }
    else {
        into -> set(field, ChartValue(content));
    }
}

PatternStore::Status Session::evaluate(std::vector<Pattern>& matches) {
    return coordinator.evaluateAll(ChartValue((ChartNode*)chart.root()), matches);
}
