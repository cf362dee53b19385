#include <patternstore.hpp>
#include <scan.hpp>
#include <util.hpp>
#include <cstdio>


struct StatementGuard { // finalizes a prepared statement however we leave the scope
    sqlite3_stmt* stmt;

    StatementGuard(sqlite3_stmt* s) : stmt(s) {}

    ~StatementGuard() {
        if (stmt != NULL) {
            sqlite3_finalize(stmt);
        }
    }
};


static size_t characterCount(const std::string& text) { // UTF-8 aware: palace and star names are mostly multi-byte
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            count ++;
        }
    }
    return count;
}

static std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (text == NULL) {
        return "";
    }
    return std::string((const char*)text, sqlite3_column_bytes(stmt, column));
}


bool PatternStore::Result::ok() {
    return status == OK;
}


PatternStore::PatternStore(std::string dbPath, size_t maxScript) : path(dbPath), maxScriptLength(maxScript) {
    if (path.find('/') != std::string::npos && !mkdirR(path)) {
        return;
    }
    if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, NULL) != SQLITE_OK) {
        printf(ERROR "Couldn't open pattern database %s: %s\n", path.c_str(), db != NULL ? sqlite3_errmsg(db) : "out of memory");
        return;
    }
    sqlite3_busy_timeout(db, 5000); // other processes may be writing too
    exec("PRAGMA journal_mode=WAL;");
    if (!exec("PRAGMA synchronous=FULL;")) { // a committed create has to survive a crash
        return;
    }
    valid = exec(
        "CREATE TABLE IF NOT EXISTS patterns ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "name TEXT NOT NULL, "
        "script TEXT NOT NULL, "
        "description TEXT NOT NULL DEFAULT '', "
        "examples TEXT NOT NULL DEFAULT '')"
    );
}

PatternStore::~PatternStore() {
    if (db != NULL) {
        sqlite3_close(db);
    }
}

bool PatternStore::exec(const char* sql) {
    char* errMsg = NULL;
    if (sqlite3_exec(db, sql, NULL, NULL, &errMsg) != SQLITE_OK) {
        printf(ERROR "SQL failed (%s): %s\n", sql, errMsg != NULL ? errMsg : sqlite3_errmsg(db));
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

PatternStore::Result PatternStore::validate(const std::string& name, const std::string& script) {
    if (isBlank(name)) {
        return {ValidationError, "", "name is required"};
    }
    if (isBlank(script)) {
        return {ValidationError, "", "script is required"};
    }
    if (characterCount(script) > maxScriptLength) {
        return {ValidationError, "", "script too long (max " + std::to_string(maxScriptLength) + " characters)"};
    }
    const char* token = deniedToken(script);
    if (token != NULL) {
        return {ValidationError, "", (std::string)"script contains forbidden identifier '" + token + "'"};
    }
    return {OK, "", ""};
}

PatternStore::Result PatternStore::create(std::string name, std::string script, std::string description, std::string examples) {
    Result check = validate(name, script);
    if (!check.ok()) {
        printf(WARNING "Refusing pattern '%s': %s\n", name.c_str(), check.message.c_str());
        return check;
    }
    if (!valid) {
        return {StorageError, "", "pattern database " + path + " isn't open"};
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!exec("BEGIN IMMEDIATE;")) { // take the write lock up front so another process can't sneak in mid-insert
        return {StorageError, "", sqlite3_errmsg(db)};
    }
    sqlite3_stmt* stmt = NULL;
    const char* sql = "INSERT INTO patterns (name, script, description, examples) VALUES (?, ?, ?, ?)";
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, NULL) != SQLITE_OK) {
        std::string why = sqlite3_errmsg(db);
        exec("ROLLBACK;");
        return {StorageError, "", why};
    }
    StatementGuard guard(stmt);
    if (sqlite3_bind_text(stmt, 1, name.c_str(), (int)name.size(), SQLITE_STATIC) != SQLITE_OK ||
        sqlite3_bind_text(stmt, 2, script.c_str(), (int)script.size(), SQLITE_STATIC) != SQLITE_OK ||
        sqlite3_bind_text(stmt, 3, description.c_str(), (int)description.size(), SQLITE_STATIC) != SQLITE_OK ||
        sqlite3_bind_text(stmt, 4, examples.c_str(), (int)examples.size(), SQLITE_STATIC) != SQLITE_OK ||
        sqlite3_step(stmt) != SQLITE_DONE) {
        std::string why = sqlite3_errmsg(db);
        exec("ROLLBACK;");
        return {StorageError, "", why};
    }
    std::string id = std::to_string((long long)sqlite3_last_insert_rowid(db));
    if (!exec("COMMIT;")) {
        std::string why = sqlite3_errmsg(db);
        exec("ROLLBACK;");
        return {StorageError, "", why};
    }
    printf(INFO "Stored pattern '%s' as #%s.\n", name.c_str(), id.c_str());
    return {OK, id, ""};
}

PatternStore::Status PatternStore::list(std::vector<Pattern>& into) {
    if (!valid) {
        printf(ERROR "Pattern database %s isn't open.\n", path.c_str());
        return StorageError;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = NULL;
    if (sqlite3_prepare_v2(db, "SELECT id, name, script, description, examples FROM patterns ORDER BY id", -1, &stmt, NULL) != SQLITE_OK) {
        printf(ERROR "Couldn't read patterns: %s\n", sqlite3_errmsg(db));
        return StorageError;
    }
    StatementGuard guard(stmt);
    std::vector<Pattern> found;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        found.push_back(Pattern {
            .id = columnText(stmt, 0),
            .name = columnText(stmt, 1),
            .script = columnText(stmt, 2),
            .description = columnText(stmt, 3),
            .examples = columnText(stmt, 4)
        });
    }
    if (rc != SQLITE_DONE) {
        printf(ERROR "Couldn't read patterns: %s\n", sqlite3_errmsg(db));
        return StorageError;
    }
    into.swap(found);
    return OK;
}

const char* PatternStore::describe(Status status) {
    switch (status) {
        case OK:
            return "ok";
        case ValidationError:
            return "validation error";
        case StorageError:
            return "storage error";
    }
    return "?";
}
