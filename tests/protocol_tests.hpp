#pragma once
#include "test_framework.hpp"
#include "test_util.hpp"
#include "../common/Protocol.hpp"
#include "../common/Utils.hpp"
#include "../server/ClientChannel.hpp"
#include "../server/SocketStreams.hpp"
#include "../server/TransferGate.hpp"
#include <sys/socket.h>
#include <unistd.h>
#include <memory>
#include <string>
#include <vector>

namespace test {

class ProtocolTests {
public:
    static TestSuite create_suite() {
        TestSuite suite;
        suite.name = "Protocol";

        suite.test_cases.push_back({"command_lines",
            "Command reader accepts text and flags binary or oversized input",
            []() { return test_command_lines(); }
        });

        suite.test_cases.push_back({"field_splitting",
            "Fields split on the separator with an optional remainder",
            []() { return test_field_splitting(); }
        });

        suite.test_cases.push_back({"frames",
            "Frames carry their type and binary payload",
            []() { return test_frames(); }
        });

        suite.test_cases.push_back({"path_resolution",
            "Names resolve below the shared root only",
            []() { return test_path_resolution(); }
        });

        suite.test_cases.push_back({"raw_source",
            "Raw upload stream stops at the declared size",
            []() { return test_raw_source(); }
        });

        suite.test_cases.push_back({"framed_source",
            "Framed upload stream ends on the E frame",
            []() { return test_framed_source(); }
        });

        suite.test_cases.push_back({"sink_holds_notifications",
            "Notifications queued during a raw download follow the payload",
            []() { return test_sink_holds_notifications(); }
        });

        suite.test_cases.push_back({"transfer_gate",
            "The gate blocks waiters until the transfer leaves",
            []() { return test_transfer_gate(); }
        });

        return suite;
    }

private:
    struct Pair {
        int a = -1;
        int b = -1;
        Pair() {
            int fds[2];
            if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0) {
                a = fds[0];
                b = fds[1];
            }
        }
        ~Pair() {
            if (a >= 0) ::close(a);
            if (b >= 0) ::close(b);
        }
    };

    static bool write_str(int fd, const string &s) {
        return proto::send_all(fd, s.data(), s.size());
    }

    static bool test_command_lines() {
        Pair p;
        string line;

        TEST_ASSERT(write_str(p.a, "LIST_FILES\r\n"));
        TEST_ASSERT(proto::recv_command_line(p.b, line) == proto::LineStatus::Ok);
        TEST_ASSERT_EQ(string("LIST_FILES"), line);

        TEST_ASSERT(write_str(p.a, "UPLOAD:a\tb.txt:3\n"));
        TEST_ASSERT(proto::recv_command_line(p.b, line) == proto::LineStatus::Ok);
        TEST_ASSERT_EQ(string("UPLOAD:a\tb.txt:3"), line);

        TEST_ASSERT(write_str(p.a, string("DOWN\0LOAD\n", 10)));
        TEST_ASSERT(proto::recv_command_line(p.b, line) == proto::LineStatus::Binary);

        Pair q;
        TEST_ASSERT(write_str(q.a, string(64, 'x') + "\n"));
        TEST_ASSERT(proto::recv_command_line(q.b, line, 16) == proto::LineStatus::TooLong);

        Pair r;
        ::close(r.a);
        r.a = -1;
        TEST_ASSERT(proto::recv_command_line(r.b, line) == proto::LineStatus::Closed);
        return true;
    }

    static bool test_field_splitting() {
        vector<string> f = proto::split_fields("LOGIN:alice@x.org:p:w", ':', 2);
        TEST_ASSERT_EQ((size_t)2, f.size());
        TEST_ASSERT_EQ(string("LOGIN"), f[0]);
        TEST_ASSERT_EQ(string("alice@x.org:p:w"), f[1]);

        f = proto::split_fields("a.txt:12:2024-01-02 03:04:05", ':', 3);
        TEST_ASSERT_EQ((size_t)3, f.size());
        TEST_ASSERT_EQ(string("2024-01-02 03:04:05"), f[2]);

        f = proto::split_fields("x|y|", '|');
        TEST_ASSERT_EQ((size_t)3, f.size());
        TEST_ASSERT(f[2].empty());

        vector<string> t = proto::split_tokens("  upload\t a.txt  b ");
        TEST_ASSERT_EQ((size_t)3, t.size());
        TEST_ASSERT_EQ(string("a.txt"), t[1]);
        return true;
    }

    static bool test_frames() {
        string payload("\0\n\x01zz", 5);
        string enc = proto::encode_frame(proto::FrameType::Data, payload);
        TEST_ASSERT_EQ(proto::FRAME_HEADER_LEN + 5, enc.size());
        TEST_ASSERT_EQ('D', enc[0]);
        TEST_ASSERT_EQ(5, (int)(unsigned char)enc[4]);

        Pair p;
        TEST_ASSERT(proto::send_frame(p.a, proto::FrameType::Data, payload));
        TEST_ASSERT(proto::send_frame(p.a, proto::FrameType::End, ""));
        proto::Frame f;
        TEST_ASSERT(proto::recv_frame(p.b, f));
        TEST_ASSERT(f.type == proto::FrameType::Data);
        TEST_ASSERT(f.payload == payload);
        TEST_ASSERT(proto::recv_frame(p.b, f));
        TEST_ASSERT(f.type == proto::FrameType::End);
        TEST_ASSERT(f.payload.empty());

        // unknown type byte
        TEST_ASSERT(write_str(p.a, string("Z\0\0\0\0", 5)));
        TEST_ASSERT(!proto::recv_frame(p.b, f));

        TEST_ASSERT(!proto::is_frame_type('X'));
        TEST_ASSERT(proto::is_frame_type('N'));
        return true;
    }

    static bool test_path_resolution() {
        string root = make_temp_dir("paths");
        TEST_ASSERT(!root.empty());

        string out, err;
        bool plain = utils::resolve_under_root(root, "a.txt", out, err);
        bool nested = utils::resolve_under_root(root, "dir/b.txt", out, err);
        bool up = utils::resolve_under_root(root, "../a.txt", out, err);
        bool sneaky = utils::resolve_under_root(root, "dir/../../a.txt", out, err);
        bool abs = utils::resolve_under_root(root, "/etc/passwd", out, err);
        bool empty = utils::resolve_under_root(root, "", out, err);
        bool self = utils::resolve_under_root(root, "dir/..", out, err);
        remove_tree(root);

        TEST_ASSERT(plain);
        TEST_ASSERT(nested);
        TEST_ASSERT(!up);
        TEST_ASSERT(!sneaky);
        TEST_ASSERT(!abs);
        TEST_ASSERT(!empty);
        TEST_ASSERT(!self);

        TEST_ASSERT_EQ(string("/srv/files/.a.txt.part"), utils::temp_path_for("/srv/files/a.txt"));
        TEST_ASSERT(utils::is_hidden_name(".a.txt.part"));
        TEST_ASSERT(!utils::is_hidden_name("a.txt"));
        TEST_ASSERT_EQ(string("a/b"), utils::join_path("a/", "b"));
        TEST_ASSERT_EQ(string("a/b"), utils::join_path("a", "b"));
        return true;
    }

    static bool test_raw_source() {
        Pair p;
        auto gate = make_shared<TransferGate>();
        gate->enter();

        // payload followed by the next command
        TEST_ASSERT(write_str(p.a, "0123456789LIST_FILES\n"));
        SocketSource src(p.b, 10, false, 1000, gate);

        string got;
        char buf[4];
        while (true) {
            ssize_t n = src.read_some(buf, sizeof(buf));
            if (n <= 0) break;
            got.append(buf, (size_t)n);
        }
        TEST_ASSERT_EQ(string("0123456789"), got);
        TEST_ASSERT(src.finish());
        TEST_ASSERT(src.aligned());
        TEST_ASSERT_EQ((uint64_t)10, src.consumed());

        TEST_ASSERT(gate->active());
        src.end();
        src.end();
        TEST_ASSERT(!gate->active());

        string line;
        TEST_ASSERT(proto::recv_line(p.b, line));
        TEST_ASSERT_EQ(string("LIST_FILES"), line);

        // a silent peer trips the stall timeout
        SocketSource stalled(p.b, 5, false, 100, nullptr);
        TEST_ASSERT(stalled.read_some(buf, sizeof(buf)) < 0);
        TEST_ASSERT(!stalled.aligned());
        TEST_ASSERT(stalled.error().find("stalled") != string::npos);
        return true;
    }

    static bool test_framed_source() {
        Pair p;
        TEST_ASSERT(proto::send_frame(p.a, proto::FrameType::Data, "hello "));
        TEST_ASSERT(proto::send_frame(p.a, proto::FrameType::Data, "world"));
        TEST_ASSERT(proto::send_frame(p.a, proto::FrameType::End, ""));

        SocketSource src(p.b, 11, true, 1000, nullptr);
        string got;
        char buf[64];
        while (got.size() < 11) {
            ssize_t n = src.read_some(buf, sizeof(buf));
            if (n <= 0) break;
            got.append(buf, (size_t)n);
        }
        TEST_ASSERT_EQ(string("hello world"), got);
        TEST_ASSERT(src.finish());
        TEST_ASSERT(src.aligned());

        // more data than declared
        Pair q;
        TEST_ASSERT(proto::send_frame(q.a, proto::FrameType::Data, "abcdef"));
        TEST_ASSERT(proto::send_frame(q.a, proto::FrameType::End, ""));
        SocketSource over(q.b, 3, true, 1000, nullptr);
        TEST_ASSERT_EQ((ssize_t)3, over.read_some(buf, sizeof(buf)));
        TEST_ASSERT(!over.finish());
        TEST_ASSERT(!over.aligned());

        // early end
        Pair r;
        TEST_ASSERT(proto::send_frame(r.a, proto::FrameType::Data, "ab"));
        TEST_ASSERT(proto::send_frame(r.a, proto::FrameType::End, ""));
        SocketSource early(r.b, 5, true, 1000, nullptr);
        TEST_ASSERT_EQ((ssize_t)2, early.read_some(buf, sizeof(buf)));
        TEST_ASSERT_EQ((ssize_t)0, early.read_some(buf, sizeof(buf)));
        TEST_ASSERT(early.aligned());
        return true;
    }

    static bool test_sink_holds_notifications() {
        Pair p;
        auto channel = make_shared<ClientChannel>(p.a, 1, "peer");
        auto gate = make_shared<TransferGate>();
        gate->enter();

        TEST_ASSERT(channel->queue_notification("NOTIFICATION:[SERVER_MESSAGE]before|"));
        {
            SocketSink sink(channel, gate);
            TEST_ASSERT(sink.begin(4));
            TEST_ASSERT(channel->held());
            TEST_ASSERT(channel->queue_notification("NOTIFICATION:[SERVER_MESSAGE]during|"));
            TEST_ASSERT(!channel->flushable());
            TEST_ASSERT(sink.write_all("ab\ncd", 2));
            TEST_ASSERT(sink.write_all("\ncd", 2));
            TEST_ASSERT(sink.complete());
            TEST_ASSERT(!sink.abandon());
        }
        TEST_ASSERT(!gate->active());
        TEST_ASSERT(!channel->held());
        TEST_ASSERT(channel->flushable());
        TEST_ASSERT(channel->flush_nonblocking() == ClientChannel::FlushResult::Done);

        string line;
        TEST_ASSERT(proto::recv_line(p.b, line));
        TEST_ASSERT_EQ(string("NOTIFICATION:[SERVER_MESSAGE]before|"), line);
        TEST_ASSERT(proto::recv_line(p.b, line));
        TEST_ASSERT_EQ(string("FILE_SIZE:4"), line);
        char data[4];
        TEST_ASSERT(proto::recv_exact(p.b, data, 4));
        TEST_ASSERT_EQ(string("ab\nc"), string(data, 4));
        TEST_ASSERT(proto::recv_line(p.b, line));
        TEST_ASSERT_EQ(string("NOTIFICATION:[SERVER_MESSAGE]during|"), line);

        // abandoned before the header: nothing is written
        auto gate2 = make_shared<TransferGate>();
        gate2->enter();
        SocketSink idle(channel, gate2);
        TEST_ASSERT(idle.abandon());
        TEST_ASSERT(!gate2->active());
        TEST_ASSERT(!idle.begin(10));
        TEST_ASSERT(!idle.started());
        return true;
    }

    static bool test_transfer_gate() {
        TransferGate gate;
        TEST_ASSERT(!gate.active());
        TEST_ASSERT(gate.wait_idle_for(chrono::milliseconds(10)));

        gate.enter();
        TEST_ASSERT(gate.active());
        TEST_ASSERT(!gate.wait_idle_for(chrono::milliseconds(50)));

        thread leaver([&] {
            this_thread::sleep_for(chrono::milliseconds(50));
            gate.leave();
        });
        gate.wait_idle();
        leaver.join();
        TEST_ASSERT(!gate.active());
        return true;
    }
};

} // namespace test
