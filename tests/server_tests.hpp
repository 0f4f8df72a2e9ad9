#pragma once
#include "test_framework.hpp"
#include "test_util.hpp"
#include "../client/NetworkClient.hpp"
#include "../common/Protocol.hpp"
#include "../common/Utils.hpp"
#include "../server/ChatHandler.hpp"
#include "../server/FileServer.hpp"
#include "../server/ServerConfig.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace test {

class ServerTests {
public:
    static TestSuite create_suite() {
        TestSuite suite;
        suite.name = "Server";

        suite.test_cases.push_back({"config",
            "Arguments and FS_* variables override the defaults",
            []() { return test_config(); }
        });

        suite.test_cases.push_back({"requires_login",
            "File commands are refused before login",
            []() { return test_requires_login(); }
        });

        suite.test_cases.push_back({"upload_notifies_others",
            "An upload is listed and announced to the other client only",
            []() { return test_upload_notifies_others(); }
        });

        suite.test_cases.push_back({"framed_roundtrip",
            "Framed clients move binary payloads and get N frames",
            []() { return test_framed_roundtrip(); }
        });

        suite.test_cases.push_back({"download_and_delete",
            "Download, delete and the replies for missing files",
            []() { return test_download_and_delete(); }
        });

        suite.test_cases.push_back({"bad_upload_requests",
            "Malformed upload commands are rejected without reading data",
            []() { return test_bad_upload_requests(); }
        });

        suite.test_cases.push_back({"binary_line_closes",
            "A binary command line ends the session",
            []() { return test_binary_line_closes(); }
        });

        suite.test_cases.push_back({"stalled_download_released",
            "A client that stops reading loses its download, lock and permit",
            []() { return test_stalled_download_released(); }
        });

        suite.test_cases.push_back({"download_timeout_before_header",
            "A download still queued at the deadline is refused, session stays",
            []() { return test_download_timeout_before_header(); }
        });

        suite.test_cases.push_back({"upload_timeout_replies",
            "An upload past its deadline is refused; a broken payload closes",
            []() { return test_upload_timeout_replies(); }
        });

        suite.test_cases.push_back({"chat_and_stats",
            "Chat goes to the installed handler; stats report counters",
            []() { return test_chat_and_stats(); }
        });

        return suite;
    }

private:
    // Server on an ephemeral port with its own root, log and database.
    struct LiveServer {
        string dir;
        ServerConfig cfg;
        unique_ptr<FileServer> server;
        thread runner;
        bool ok = false;

        explicit LiveServer(int64_t op_timeout_ms = 5000, int64_t stall_timeout_ms = 2000,
                            size_t workers = 4)
            : dir(make_temp_dir("server")) {
            cfg.port = 0;
            cfg.root_dir = dir + "/shared";
            cfg.log_path = dir + "/server.log";
            cfg.db_path = dir + "/fileshare.db";
            cfg.log_echo = false;
            cfg.udp_enabled = false;
            cfg.worker_count = workers;
            cfg.op_timeout_ms = op_timeout_ms;
            cfg.stall_timeout_ms = stall_timeout_ms;

            server.reset(new FileServer(cfg));
            string err;
            ok = server->start(err);
            if (!ok) {
                cerr << "  server start failed: " << err << "\n";
                return;
            }
            runner = thread([this] { server->run(); });
        }

        ~LiveServer() {
            server->stop();
            if (runner.joinable()) runner.join();
            server.reset();
            remove_tree(dir);
        }

        int port() const { return server->port(); }
    };

    struct RecordingChat : public ChatHandler {
        mutex mtx;
        vector<string> messages;

        bool on_message(const string &from, const string &text, string &err) override {
            if (text == "forbidden") {
                err = "Message rejected";
                return false;
            }
            lock_guard<mutex> lk(mtx);
            messages.push_back(from + ": " + text);
            return true;
        }
    };

    static bool join(LiveServer &s, NetworkClient &c, const string &name) {
        string err, shown;
        if (!c.connect_to("127.0.0.1", s.port(), err)) {
            cerr << "  connect: " << err << "\n";
            return false;
        }
        if (!c.signup(name, name + "@example.org", "secret-" + name, err)) {
            cerr << "  signup: " << err << "\n";
            return false;
        }
        if (!c.login(name + "@example.org", "secret-" + name, shown, err)) {
            cerr << "  login: " << err << "\n";
            return false;
        }
        return shown == name;
    }

    // Wait for a notification that contains tag; others are skipped.
    static bool await_notification(NetworkClient &c, const string &tag, string &out,
                                   int timeout_ms) {
        auto deadline = chrono::steady_clock::now() + chrono::milliseconds(timeout_ms);
        while (chrono::steady_clock::now() < deadline) {
            string note;
            int left = (int)chrono::duration_cast<chrono::milliseconds>(
                deadline - chrono::steady_clock::now()).count();
            if (!c.wait_notification(note, left > 0 ? left : 1)) continue;
            if (note.find(tag) != string::npos) {
                out = note;
                return true;
            }
        }
        return false;
    }

    // rcvbuf > 0 shrinks the receive buffer before connecting
    static int raw_connect(int port, int rcvbuf = 0) {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) return -1;
        if (rcvbuf > 0) {
            ::setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf));
        }
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons((uint16_t)port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (::connect(fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
            ::close(fd);
            return -1;
        }
        return fd;
    }

    static bool send_text(int fd, const string &line) {
        string out = line + "\n";
        return proto::send_all(fd, out.data(), out.size());
    }

    static bool read_reply_within(int fd, string &line, int timeout_ms) {
        if (proto::wait_readable(fd, timeout_ms) != 1) return false;
        return proto::recv_line(fd, line);
    }

    // Greeting, SIGNUP and LOGIN over a plain socket.
    static bool raw_login(int fd, const string &name) {
        string line;
        if (!read_reply_within(fd, line, 3000)) return false;
        string email = name + "@example.org";
        if (!send_text(fd, "SIGNUP:" + name + ":" + email + ":secret-" + name)) return false;
        if (!read_reply_within(fd, line, 3000) || line != "SIGNUP_SUCCESS") return false;
        if (!send_text(fd, "LOGIN:" + email + ":secret-" + name)) return false;
        if (!read_reply_within(fd, line, 3000)) return false;
        return line == "LOGIN_SUCCESS:" + name;
    }

    // true once the server closed its end
    static bool closed_by_server(int fd, int timeout_ms) {
        auto deadline = chrono::steady_clock::now() + chrono::milliseconds(timeout_ms);
        char buf[4096];
        while (chrono::steady_clock::now() < deadline) {
            if (proto::wait_readable(fd, 100) == 0) continue;
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) return true;
        }
        return false;
    }

    static bool test_config() {
        ServerConfig cfg;
        TEST_ASSERT_EQ(8080, cfg.port);
        TEST_ASSERT_EQ((size_t)10, cfg.worker_count);
        TEST_ASSERT_EQ((int64_t)30000, cfg.op_timeout_ms);
        TEST_ASSERT_EQ(9876, cfg.udp_port);

        char prog[] = "fileshare_server";
        char port[] = "9000";
        char root[] = "/tmp/shared_here";
        char *argv[] = {prog, port, root};
        string err;
        TEST_ASSERT(cfg.apply_args(3, argv, err));
        TEST_ASSERT_EQ(9000, cfg.port);
        TEST_ASSERT_EQ(string("/tmp/shared_here"), cfg.root_dir);

        char bad[] = "http";
        char *bad_argv[] = {prog, bad};
        TEST_ASSERT(!cfg.apply_args(2, bad_argv, err));
        TEST_ASSERT(!err.empty());

        ::setenv("FS_WORKERS", "3", 1);
        ::setenv("FS_UDP_ENABLED", "off", 1);
        ::setenv("FS_TIMEOUT_MS", "1500", 1);
        bool env_ok = cfg.load_from_env(err);
        ::setenv("FS_WORKERS", "many", 1);
        string bad_err;
        bool env_bad = cfg.load_from_env(bad_err);
        ::unsetenv("FS_WORKERS");
        ::unsetenv("FS_UDP_ENABLED");
        ::unsetenv("FS_TIMEOUT_MS");

        TEST_ASSERT(env_ok);
        TEST_ASSERT_EQ((size_t)3, cfg.worker_count);
        TEST_ASSERT(!cfg.udp_enabled);
        TEST_ASSERT_EQ((int64_t)1500, cfg.op_timeout_ms);
        TEST_ASSERT(!env_bad);
        TEST_ASSERT(bad_err.find("FS_WORKERS") != string::npos);
        return true;
    }

    static bool test_requires_login() {
        LiveServer s;
        TEST_ASSERT(s.ok);

        NetworkClient c;
        string err, reply;
        TEST_ASSERT(c.connect_to("127.0.0.1", s.port(), err));
        TEST_ASSERT_EQ(string("Welcome to File Sharing Server"), c.banner());

        TEST_ASSERT(c.send_raw_command("LIST_FILES", reply, err));
        TEST_ASSERT_EQ(string("ERROR:Not authenticated"), reply);
        TEST_ASSERT(c.send_raw_command("DOWNLOAD:x.txt", reply, err));
        TEST_ASSERT_EQ(string("ERROR:Not authenticated"), reply);

        string name;
        TEST_ASSERT(!c.login("ghost@example.org", "nope", name, err));
        TEST_ASSERT_EQ(string("LOGIN_FAILED:Invalid credentials"), err);

        TEST_ASSERT(c.signup("gina", "gina@example.org", "pw", err));
        TEST_ASSERT(!c.signup("gina2", "gina@example.org", "pw", err));
        TEST_ASSERT_EQ(string("SIGNUP_FAILED:EMAIL_EXISTS"), err);
        TEST_ASSERT(!c.login("gina@example.org", "wrong", name, err));
        TEST_ASSERT(c.login("gina@example.org", "pw", name, err));
        TEST_ASSERT_EQ(string("gina"), name);
        TEST_ASSERT(wait_until([&] { return s.server->is_user_online("gina"); }, 2000));

        TEST_ASSERT(c.send_raw_command("FROBNICATE:1", reply, err));
        TEST_ASSERT_EQ(string("ERROR:Unknown command"), reply);

        TEST_ASSERT(c.logout(err));
        TEST_ASSERT(c.send_raw_command("LIST_FILES", reply, err));
        TEST_ASSERT_EQ(string("ERROR:Not authenticated"), reply);
        TEST_ASSERT(!s.server->is_user_online("gina"));
        return true;
    }

    static bool test_upload_notifies_others() {
        LiveServer s;
        TEST_ASSERT(s.ok);

        NetworkClient a, b;
        TEST_ASSERT(join(s, a, "alice"));
        TEST_ASSERT(join(s, b, "bob"));
        TEST_ASSERT(wait_until([&] {
            return s.server->broadcaster().statistics().registered_clients == 2;
        }, 2000));

        // bob's login is announced to alice
        string note;
        TEST_ASSERT(await_notification(a, "[CLIENT_CONNECTED]New client connected: bob", note, 2000));

        string payload = make_payload(1024, 21);
        string err;
        TEST_ASSERT(a.upload_bytes("report.txt", payload, err));

        TEST_ASSERT(await_notification(b, "[NEW_FILE]", note, 3000));
        TEST_ASSERT_EQ(string("NOTIFICATION:[NEW_FILE]New file available: report.txt|Uploaded by: alice"),
                       note);

        // exactly one, and none for the uploader
        string extra;
        TEST_ASSERT(!await_notification(b, "[NEW_FILE]", extra, 300));
        TEST_ASSERT(!await_notification(a, "[NEW_FILE]", extra, 300));

        vector<NetworkClient::RemoteFile> files;
        TEST_ASSERT(b.list_files(files, err));
        TEST_ASSERT_EQ((size_t)1, files.size());
        TEST_ASSERT_EQ(string("report.txt"), files[0].name);
        TEST_ASSERT_EQ((uint64_t)1024, files[0].size);
        TEST_ASSERT(!files[0].modified.empty());

        TEST_ASSERT(read_file(s.cfg.root_dir + "/report.txt") == payload);

        int64_t uploads = 0;
        TEST_ASSERT(wait_until([&] {
            string e;
            return s.server->db().count_logs("upload", uploads, e) && uploads == 1;
        }, 2000));

        int64_t users = 0;
        TEST_ASSERT(s.server->db().count_users(users, err));
        TEST_ASSERT_EQ((int64_t)2, users);

        // bob leaves; alice hears about it
        TEST_ASSERT(b.logout(err));
        TEST_ASSERT(await_notification(a, "[CLIENT_DISCONNECTED]Client disconnected: bob", note, 2000));
        return true;
    }

    static bool test_framed_roundtrip() {
        LiveServer s;
        TEST_ASSERT(s.ok);

        NetworkClient a, b;
        TEST_ASSERT(join(s, a, "carol"));
        TEST_ASSERT(join(s, b, "dan"));
        string err;
        TEST_ASSERT(a.use_framed(err));
        TEST_ASSERT(a.framed());
        TEST_ASSERT(b.use_framed(err));

        // binary payload with newlines and bytes that look like frame headers
        string payload = make_payload(300 * 1024 + 13, 33);
        TEST_ASSERT(a.upload_bytes("image.bin", payload, err));

        string back;
        TEST_ASSERT(b.download_bytes("image.bin", back, err));
        TEST_ASSERT(back == payload);

        string note;
        TEST_ASSERT(await_notification(b, "[NEW_FILE]New file available: image.bin", note, 3000));

        // an empty payload is just the E frame
        TEST_ASSERT(a.upload_bytes("empty.bin", "", err));
        TEST_ASSERT(b.download_bytes("empty.bin", back, err));
        TEST_ASSERT(back.empty());

        vector<NetworkClient::RemoteFile> files;
        TEST_ASSERT(b.list_files(files, err));
        TEST_ASSERT_EQ((size_t)2, files.size());
        TEST_ASSERT_EQ(string("empty.bin"), files[0].name);
        TEST_ASSERT_EQ(string("image.bin"), files[1].name);
        TEST_ASSERT_EQ((uint64_t)payload.size(), files[1].size);
        return true;
    }

    static bool test_download_and_delete() {
        LiveServer s;
        TEST_ASSERT(s.ok);

        NetworkClient a, b;
        TEST_ASSERT(join(s, a, "erin"));
        TEST_ASSERT(join(s, b, "fred"));
        string err;

        string missing;
        TEST_ASSERT(!a.download_bytes("nothing.txt", missing, err));
        TEST_ASSERT_EQ(string("ERROR:File not found"), err);

        TEST_ASSERT(a.upload_bytes("notes.txt", "line one\nline two\n", err));
        TEST_ASSERT(a.upload_bytes("empty.txt", "", err));

        string data;
        TEST_ASSERT(b.download_bytes("notes.txt", data, err));
        TEST_ASSERT_EQ(string("line one\nline two\n"), data);
        TEST_ASSERT(b.download_bytes("empty.txt", data, err));
        TEST_ASSERT(data.empty());

        // session is still in sync after the raw payloads
        vector<NetworkClient::RemoteFile> files;
        TEST_ASSERT(b.list_files(files, err));
        TEST_ASSERT_EQ((size_t)2, files.size());

        TEST_ASSERT(a.delete_file("notes.txt", err));
        string note;
        TEST_ASSERT(await_notification(b, "[FILE_DELETED]File deleted: notes.txt", note, 3000));
        TEST_ASSERT(!a.delete_file("notes.txt", err));
        TEST_ASSERT_EQ(string("DELETE_FAILED:File not found"), err);

        TEST_ASSERT(b.list_files(files, err));
        TEST_ASSERT_EQ((size_t)1, files.size());
        TEST_ASSERT_EQ(string("empty.txt"), files[0].name);
        return true;
    }

    static bool test_bad_upload_requests() {
        LiveServer s;
        TEST_ASSERT(s.ok);

        NetworkClient c;
        TEST_ASSERT(join(s, c, "gus"));
        string reply, err;

        TEST_ASSERT(c.send_raw_command("UPLOAD:a.txt:lots", reply, err));
        TEST_ASSERT_EQ(string("ERROR:Invalid size"), reply);
        TEST_ASSERT(c.send_raw_command("UPLOAD:a.txt", reply, err));
        TEST_ASSERT(reply.rfind("ERROR:", 0) == 0);
        TEST_ASSERT(c.send_raw_command("UPLOAD:../evil.txt:3", reply, err));
        TEST_ASSERT_EQ(string("UPLOAD_FAILED:Invalid file name"), reply);
        TEST_ASSERT(c.send_raw_command("UPLOAD:dir/a.txt:3", reply, err));
        TEST_ASSERT_EQ(string("UPLOAD_FAILED:Invalid file name"), reply);
        TEST_ASSERT(c.send_raw_command("DOWNLOAD:../../etc/passwd", reply, err));
        TEST_ASSERT(reply.rfind("ERROR:", 0) == 0);

        // nothing was consumed as payload: the session still answers
        vector<NetworkClient::RemoteFile> files;
        TEST_ASSERT(c.list_files(files, err));
        TEST_ASSERT(files.empty());
        return true;
    }

    static bool test_binary_line_closes() {
        LiveServer s;
        TEST_ASSERT(s.ok);

        int fd = raw_connect(s.port());
        TEST_ASSERT(fd >= 0);
        string greeting;
        bool greeted = proto::recv_line(fd, greeting);
        bool sent = proto::send_all(fd, "\x01\x02\x03garbage\n", 11);

        bool closed = false;
        if (proto::wait_readable(fd, 3000) != 0) {
            char c;
            closed = ::recv(fd, &c, 1, 0) <= 0;
        }
        ::close(fd);

        TEST_ASSERT(greeted);
        TEST_ASSERT_EQ(string("CONNECTED:Welcome to File Sharing Server"), greeting);
        TEST_ASSERT(sent);
        TEST_ASSERT(closed);
        TEST_ASSERT(wait_until([&] { return s.server->session_count() == 0; }, 3000));
        return true;
    }

    static bool test_stalled_download_released() {
        LiveServer s(1000, 500, 2);
        TEST_ASSERT(s.ok);
        TEST_ASSERT(write_file(s.cfg.root_dir + "/big.bin", string(16 * 1024 * 1024, 'x')));
        string path, err;
        TEST_ASSERT(s.server->coordinator().resolve("big.bin", path, err));

        int fd = raw_connect(s.port(), 4096);
        TEST_ASSERT(fd >= 0);
        bool logged_in = raw_login(fd, "ivan");
        bool sent = send_text(fd, "DOWNLOAD:big.bin");

        // never read: the server's send buffer fills and stays full
        bool started = wait_until([&] { return s.server->locks().is_in_use(path); }, 3000);
        bool released = wait_until([&] {
            return !s.server->locks().is_in_use(path) &&
                   s.server->executor().available_permits() == 2;
        }, 6000);
        bool session_gone = wait_until([&] { return s.server->session_count() == 0; }, 6000);
        ::close(fd);

        TEST_ASSERT(logged_in);
        TEST_ASSERT(sent);
        TEST_ASSERT(started);
        TEST_ASSERT(released);
        TEST_ASSERT(session_gone);

        // the file is writable again
        NetworkClient c;
        TEST_ASSERT(join(s, c, "judy"));
        TEST_ASSERT(c.upload_bytes("big.bin", "small now", err));
        TEST_ASSERT_EQ(string("small now"), read_file(path));
        return true;
    }

    static bool test_download_timeout_before_header() {
        LiveServer s(300, 2000);
        TEST_ASSERT(s.ok);
        TEST_ASSERT(write_file(s.cfg.root_dir + "/locked.txt", "guarded"));
        string path, err;
        TEST_ASSERT(s.server->coordinator().resolve("locked.txt", path, err));

        int fd = raw_connect(s.port());
        TEST_ASSERT(fd >= 0);
        bool logged_in = raw_login(fd, "kim");

        string reply, listing;
        bool got_reply = false;
        {
            FileLockRegistry::Guard writer = s.server->locks().acquire_write(path);
            if (logged_in && send_text(fd, "DOWNLOAD:locked.txt")) {
                got_reply = read_reply_within(fd, reply, 3000);
            }
        }
        bool listed = send_text(fd, "LIST_FILES") && read_reply_within(fd, listing, 3000);
        ::close(fd);

        TEST_ASSERT(logged_in);
        TEST_ASSERT(got_reply);
        TEST_ASSERT_EQ(string("ERROR:Download timeout"), reply);
        TEST_ASSERT(listed);
        TEST_ASSERT(listing.rfind("FILE_LIST:", 0) == 0);
        TEST_ASSERT(listing.find("locked.txt:7:") != string::npos);
        TEST_ASSERT(wait_until([&] { return !s.server->locks().is_in_use(path); }, 3000));
        return true;
    }

    static bool test_upload_timeout_replies() {
        LiveServer s(300, 1500);
        TEST_ASSERT(s.ok);

        // payload completed after the deadline: session carries on
        int fd = raw_connect(s.port());
        TEST_ASSERT(fd >= 0);
        bool logged_in = raw_login(fd, "lena");
        string ready, failed, listing;
        bool ok = logged_in && send_text(fd, "UPLOAD:slow.bin:20") &&
                  read_reply_within(fd, ready, 3000) &&
                  proto::send_all(fd, "01234", 5) &&
                  read_reply_within(fd, failed, 3000) &&
                  proto::send_all(fd, "56789abcdefghij", 15);
        bool listed = ok && send_text(fd, "LIST_FILES") && read_reply_within(fd, listing, 3000);
        ::close(fd);

        TEST_ASSERT(logged_in);
        TEST_ASSERT(ok);
        TEST_ASSERT_EQ(string("READY:Ready to receive file"), ready);
        TEST_ASSERT_EQ(string("UPLOAD_FAILED:Upload timeout"), failed);
        TEST_ASSERT(listed);
        TEST_ASSERT(listing.rfind("FILE_LIST:", 0) == 0);

        // payload abandoned: the stream cannot be trusted, connection closes
        int fd2 = raw_connect(s.port());
        TEST_ASSERT(fd2 >= 0);
        bool logged_in2 = raw_login(fd2, "mona");
        string ready2, failed2;
        bool ok2 = logged_in2 && send_text(fd2, "UPLOAD:stuck.bin:20") &&
                   read_reply_within(fd2, ready2, 3000) &&
                   proto::send_all(fd2, "01234", 5) &&
                   read_reply_within(fd2, failed2, 3000);
        bool closed = ok2 && closed_by_server(fd2, 5000);
        ::close(fd2);

        TEST_ASSERT(ok2);
        TEST_ASSERT_EQ(string("UPLOAD_FAILED:Upload timeout"), failed2);
        TEST_ASSERT(closed);

        string slow = s.cfg.root_dir + "/slow.bin";
        TEST_ASSERT(wait_until([&] { return utils::file_exists(slow); }, 3000));
        TEST_ASSERT_EQ(string("0123456789abcdefghij"), read_file(slow));
        TEST_ASSERT(!utils::file_exists(s.cfg.root_dir + "/stuck.bin"));
        return true;
    }

    static bool test_chat_and_stats() {
        LiveServer s;
        TEST_ASSERT(s.ok);

        NetworkClient c;
        TEST_ASSERT(join(s, c, "hana"));
        string err;
        TEST_ASSERT(!c.chat("hello", err));
        TEST_ASSERT_EQ(string("ERROR:Chat not available"), err);

        auto chat = make_shared<RecordingChat>();
        s.server->set_chat_handler(chat);
        TEST_ASSERT(c.chat("hello there", err));
        TEST_ASSERT(!c.chat("forbidden", err));
        TEST_ASSERT_EQ(string("ERROR:Message rejected"), err);
        {
            lock_guard<mutex> lk(chat->mtx);
            TEST_ASSERT_EQ((size_t)1, chat->messages.size());
            TEST_ASSERT_EQ(string("hana: hello there"), chat->messages[0]);
        }

        TEST_ASSERT(c.upload_bytes("s.txt", "12345", err));
        string summary;
        TEST_ASSERT(c.stats(summary, err));
        TEST_ASSERT(summary.find("sessions=1") != string::npos);
        TEST_ASSERT(summary.find("online=1") != string::npos);
        TEST_ASSERT(summary.find("uploads=1") != string::npos);
        TEST_ASSERT(summary.find("bytes_in=5") != string::npos);
        TEST_ASSERT(summary.find("udp=off") != string::npos);
        return true;
    }
};

} // namespace test
