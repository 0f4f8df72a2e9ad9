#pragma once
#include <string>

using namespace std;

// Receives CHAT:<text> lines from authenticated sessions.
class ChatHandler {
public:
    virtual ~ChatHandler() = default;

    // false (and err) if the message could not be delivered
    virtual bool on_message(const string &from, const string &text, string &err) = 0;
};
