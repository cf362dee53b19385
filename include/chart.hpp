// The host side of a chart: a read-only graph of values handed to us by whatever engine computed it.
// Nodes are owned by a ChartContext; everything else holds plain non-owning pointers, so cycles are fine.
#pragma once
#include <defs.h>
#include <string>
#include <vector>
#include <functional>


struct ChartValue {
    enum Type {
        Absent,
        Boolean,
        Number,
        String,
        Reference // points at a ChartNode (object, array or callable)
    } type = Absent;

    bool boolean = false;
    double number = 0;
    std::string string;
    ChartNode* node = NULL;

    ChartValue();

    ChartValue(bool value);

    ChartValue(int value);

    ChartValue(double value);

    ChartValue(const char* value);

    ChartValue(std::string value);

    ChartValue(ChartNode* value);

    bool isAbsent();
};


struct ChartNode { // superclass. external engines subclass this to serve lazily computed data
    enum Kind {
        Object,
        Array,
        Function
    } kind;

    ChartNode(Kind k) : kind(k) {}

    virtual ~ChartNode();

    virtual ChartValue get(const std::string& key); // named field lookup; Absent if there isn't one

    virtual ChartValue at(size_t index); // zero-based element lookup

    virtual size_t length(); // element count for arrays, field count for objects

    virtual std::vector<std::string> keys();

    virtual ChartValue call(ChartNode* self, std::vector<ChartValue>& args); // self is the real object the function was read from (NULL if none)
};


struct ChartObject : ChartNode {
    std::vector<std::pair<std::string, ChartValue>> fields; // kept in insertion order

    ChartObject();

    void set(std::string key, ChartValue value); // replaces an existing field of the same name

    ChartValue get(const std::string& key);

    size_t length();

    std::vector<std::string> keys();
};


struct ChartArray : ChartNode {
    std::vector<ChartValue> items;

    ChartArray();

    void push(ChartValue value);

    ChartValue at(size_t index);

    size_t length();
};


typedef std::function<ChartValue(ChartNode* self, std::vector<ChartValue>& args)> ChartCallable;

struct ChartFunction : ChartNode {
    ChartCallable body;

    ChartFunction(ChartCallable b);

    ChartValue call(ChartNode* self, std::vector<ChartValue>& args);
};


struct ChartContext { // owns every node of one computed chart
    std::vector<ChartNode*> nodes;

    ChartContext();

    ~ChartContext();

    ChartContext(const ChartContext&) = delete;

    ChartContext& operator=(const ChartContext&) = delete;

    ChartObject* root(); // the top-level object, created with the context

    ChartObject* object();

    ChartArray* array();

    ChartFunction* function(ChartCallable body);

    ChartNode* adopt(ChartNode* node); // take ownership of an engine-specific node

    ChartObject* path(std::string dotted, bool create = true); // walk (and optionally build) nested objects: "palace.stars" -> root.palace.stars
};
