// PatternStore keeps pattern records in an SQLite database. Records are create-and-list only: ids come from an AUTOINCREMENT
// rowid, so they're never reused, and nothing is ever updated in place.
// Every script is validated (blank fields, length, deny-list scan) before it is written. That's a second line of defense,
// not a promise: scripts read back out of the database are still untrusted.
#pragma once
#include <defs.h>
#include <string>
#include <vector>
#include <mutex>
#include <sqlite3.h>


struct Pattern {
    std::string id;
    std::string name;
    std::string script;
    std::string description;
    std::string examples;
};


struct PatternStore {
    enum Status {
        OK,
        ValidationError, // bad input; nothing was written
        StorageError // the database let us down
    };

    struct Result {
        Status status;
        std::string id; // set when status == OK
        std::string message;

        bool ok();
    };

    sqlite3* db = NULL;
    std::string path;
    size_t maxScriptLength;
    bool valid = false; // set once the database is open and the schema is in place

    PatternStore(std::string dbPath, size_t maxScript = DEFAULT_MAX_SCRIPT_LENGTH);

    PatternStore(const PatternStore&) = delete;

    ~PatternStore();

    Result create(std::string name, std::string script, std::string description = "", std::string examples = "");

    Status list(std::vector<Pattern>& into); // every committed pattern in creation order. into is only touched on success

    Result validate(const std::string& name, const std::string& script); // the static checks create() runs, without writing

    static const char* describe(Status status);

private:
    std::mutex m_mutex; // one writer at a time, and the connection isn't shared mid-statement

    bool exec(const char* sql);
};
