#pragma once
#include <string>
#include <cstdint>

using namespace std;

struct UserRecord {
    int id = 0;
    string name;
    string email;
    string password_hash;
};

// Credential store and audit trail. The transfer core only talks to this
// interface; DbSqlite is the bundled implementation.
class Db {
public:
    virtual ~Db() = default;

    virtual bool init_schema(string &err) = 0;

    // false with empty err: no such user
    virtual bool get_user_by_email(const string &email,
                                   UserRecord &out,
                                   string &err) = 0;

    virtual bool create_user(const string &name,
                             const string &email,
                             const string &password_hash,
                             string &err) = 0;

    virtual bool insert_log(int user_id,
                            const string &action,
                            const string &detail,
                            const string &remote_ip,
                            string &err) = 0;

    virtual bool count_logs(const string &action, int64_t &count, string &err) = 0;
    virtual bool count_users(int64_t &count, string &err) = 0;
};
