#include <chart.hpp>


ChartValue::ChartValue() {}

ChartValue::ChartValue(bool value) : type(Boolean), boolean(value) {}

ChartValue::ChartValue(int value) : type(Number), number(value) {}

ChartValue::ChartValue(double value) : type(Number), number(value) {}

ChartValue::ChartValue(const char* value) : type(String), string(value) {}

ChartValue::ChartValue(std::string value) : type(String), string(value) {}

ChartValue::ChartValue(ChartNode* value) {
    if (value != NULL) {
        type = Reference;
        node = value;
    }
}

bool ChartValue::isAbsent() {
    return type == Absent;
}


ChartNode::~ChartNode() {}

ChartValue ChartNode::get(const std::string& key) {
    return ChartValue();
}

ChartValue ChartNode::at(size_t index) {
    return ChartValue();
}

size_t ChartNode::length() {
    return 0;
}

std::vector<std::string> ChartNode::keys() {
    return {};
}

ChartValue ChartNode::call(ChartNode* self, std::vector<ChartValue>& args) {
    return ChartValue();
}


ChartObject::ChartObject() : ChartNode(Object) {}

void ChartObject::set(std::string key, ChartValue value) {
    for (size_t i = 0; i < fields.size(); i ++) {
        if (fields[i].first == key) {
            fields[i].second = value;
            return;
        }
    }
    fields.push_back({key, value});
}

ChartValue ChartObject::get(const std::string& key) {
    for (size_t i = 0; i < fields.size(); i ++) {
        if (fields[i].first == key) {
            return fields[i].second;
        }
    }
    return ChartValue();
}

size_t ChartObject::length() {
    return fields.size();
}

std::vector<std::string> ChartObject::keys() {
    std::vector<std::string> ret;
    ret.reserve(fields.size());
    for (auto& field : fields) {
        ret.push_back(field.first);
    }
    return ret;
}


ChartArray::ChartArray() : ChartNode(Array) {}

void ChartArray::push(ChartValue value) {
    items.push_back(value);
}

ChartValue ChartArray::at(size_t index) {
    if (index >= items.size()) {
        return ChartValue();
    }
    return items[index];
}

size_t ChartArray::length() {
    return items.size();
}


ChartFunction::ChartFunction(ChartCallable b) : ChartNode(Function), body(b) {}

ChartValue ChartFunction::call(ChartNode* self, std::vector<ChartValue>& args) {
    if (!body) {
        return ChartValue();
    }
    return body(self, args);
}


ChartContext::ChartContext() {
    nodes.push_back(new ChartObject); // nodes[0] is always the root
}

ChartContext::~ChartContext() {
    for (ChartNode* node : nodes) {
        delete node;
    }
}

ChartObject* ChartContext::root() {
    return (ChartObject*)nodes[0];
}

ChartObject* ChartContext::object() {
    return (ChartObject*)adopt(new ChartObject);
}

ChartArray* ChartContext::array() {
    return (ChartArray*)adopt(new ChartArray);
}

ChartFunction* ChartContext::function(ChartCallable body) {
    return (ChartFunction*)adopt(new ChartFunction(body));
}

ChartNode* ChartContext::adopt(ChartNode* node) {
    nodes.push_back(node);
    return node;
}

ChartObject* ChartContext::path(std::string dotted, bool create) {
    ChartObject* current = root();
    size_t start = 0;
    while (start < dotted.size()) {
        size_t end = dotted.find('.', start);
        if (end == std::string::npos) {
            end = dotted.size();
        }
        std::string segment = dotted.substr(start, end - start);
        start = end + 1;
        if (segment.size() == 0) { // "a..b" or a trailing dot; skip the empty bit
            continue;
        }
        ChartValue next = current -> get(segment);
        ChartObject* found = next.type == ChartValue::Reference ? dynamic_cast<ChartObject*>(next.node) : NULL; // engine nodes can't be set() on
        if (found != NULL) {
            current = found;
        }
        else if (create) { // anything that isn't a ChartObject gets replaced
            ChartObject* made = object();
            current -> set(segment, made);
            current = made;
        }
        else {
            return NULL;
        }
    }
    return current;
}
