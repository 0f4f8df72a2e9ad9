#include "DbSqlite.hpp"
#include <iostream>

DbSqlite::DbSqlite(const string &db_path) : db_path_(db_path) {
    if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
        cerr << "Cannot open SQLite: " << (db_ ? sqlite3_errmsg(db_) : "out of memory") << "\n";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
    } else {
        char *errmsg = nullptr;
        sqlite3_exec(db_, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &errmsg);
        if (errmsg) sqlite3_free(errmsg);
        sqlite3_busy_timeout(db_, 2000);
    }
}

DbSqlite::~DbSqlite() {
    if (db_) sqlite3_close(db_);
}

bool DbSqlite::init_schema(string &err) {
    const char *sql_tables = R"SQL(
PRAGMA foreign_keys = ON;

CREATE TABLE IF NOT EXISTS app_user (
    id            INTEGER PRIMARY KEY AUTOINCREMENT,
    name          TEXT NOT NULL,
    email         TEXT UNIQUE NOT NULL,
    password_hash TEXT NOT NULL,
    created_at    DATETIME DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE IF NOT EXISTS audit_log (
    id          INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id     INTEGER,
    action      TEXT NOT NULL,
    detail      TEXT,
    created_at  DATETIME DEFAULT CURRENT_TIMESTAMP,
    remote_ip   TEXT,
    FOREIGN KEY(user_id) REFERENCES app_user(id) ON DELETE SET NULL
);

CREATE INDEX IF NOT EXISTS idx_audit_log_action
    ON audit_log(action);
)SQL";

    lock_guard<mutex> lock(mtx_);
    if (!db_) {
        err = "Database not open";
        return false;
    }

    char *errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql_tables, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        err = errmsg ? errmsg : "Unknown SQLite error";
        if (errmsg) sqlite3_free(errmsg);
        return false;
    }
    return true;
}

bool DbSqlite::get_user_by_email(const string &email,
                                 UserRecord &out,
                                 string &err) {
    const char *sql =
        "SELECT id, name, email, password_hash "
        "FROM app_user WHERE email = ?;";

    lock_guard<mutex> lock(mtx_);
    if (!db_) {
        err = "Database not open";
        return false;
    }

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, email.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        out.id            = sqlite3_column_int(stmt, 0);
        out.name          = (const char*)sqlite3_column_text(stmt, 1);
        out.email         = (const char*)sqlite3_column_text(stmt, 2);
        out.password_hash = (const char*)sqlite3_column_text(stmt, 3);
        sqlite3_finalize(stmt);
        return true;
    } else if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return false;
    } else {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
}

bool DbSqlite::create_user(const string &name,
                           const string &email,
                           const string &password_hash,
                           string &err) {
    const char *sql =
        "INSERT INTO app_user(name, email, password_hash) VALUES(?, ?, ?);";

    lock_guard<mutex> lock(mtx_);
    if (!db_) {
        err = "Database not open";
        return false;
    }

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, email.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, password_hash.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::insert_log(int user_id,
                          const string &action,
                          const string &detail,
                          const string &remote_ip,
                          string &err) {
    const char *sql =
        "INSERT INTO audit_log(user_id, action, detail, remote_ip) "
        "VALUES(?, ?, ?, ?);";

    lock_guard<mutex> lock(mtx_);
    if (!db_) {
        err = "Database not open";
        return false;
    }

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    if (user_id > 0)
        sqlite3_bind_int(stmt, 1, user_id);
    else
        sqlite3_bind_null(stmt, 1);
    sqlite3_bind_text(stmt, 2, action.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, detail.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, remote_ip.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::count_logs(const string &action, int64_t &count, string &err) {
    const char *sql = "SELECT COUNT(*) FROM audit_log WHERE action = ?;";

    lock_guard<mutex> lock(mtx_);
    if (!db_) {
        err = "Database not open";
        return false;
    }

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }
    sqlite3_bind_text(stmt, 1, action.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    count = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::count_users(int64_t &count, string &err) {
    const char *sql = "SELECT COUNT(*) FROM app_user;";

    lock_guard<mutex> lock(mtx_);
    if (!db_) {
        err = "Database not open";
        return false;
    }

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    count = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return true;
}
