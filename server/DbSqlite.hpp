#pragma once
#include "Db.hpp"
#include <mutex>
#include <sqlite3.h>

using namespace std;

class DbSqlite : public Db {
public:
    explicit DbSqlite(const string &db_path);
    ~DbSqlite() override;

    DbSqlite(const DbSqlite&) = delete;
    DbSqlite& operator=(const DbSqlite&) = delete;

    bool is_open() const { return db_ != nullptr; }

    bool init_schema(string &err) override;

    bool get_user_by_email(const string &email,
                           UserRecord &out,
                           string &err) override;

    bool create_user(const string &name,
                     const string &email,
                     const string &password_hash,
                     string &err) override;

    bool insert_log(int user_id,
                    const string &action,
                    const string &detail,
                    const string &remote_ip,
                    string &err) override;

    bool count_logs(const string &action, int64_t &count, string &err) override;
    bool count_users(int64_t &count, string &err) override;

private:
    string db_path_;
    sqlite3 *db_ = nullptr;
    mutex mtx_;
};
