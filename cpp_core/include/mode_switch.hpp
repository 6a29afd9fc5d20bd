#pragma once
#include "encounter_state.hpp"
#include <atomic>
#include <istream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <unistd.h>

/**
 * @class ModeSwitch
 * @brief Mailbox between the console thread and the engine loop.
 *
 * The console side only posts requests. The engine drains them at the start
 * of each cycle, so the state keeps a single writer.
 */
class ModeSwitch {
public:
    void Request(Mode mode);
    void RequestStatus() { status_requested_ = true; }
    void RequestQuit() { quit_requested_ = true; }

    // Applies a pending mode request. Returns true when the mode changed.
    bool ApplyPending(EncounterState& state);
    bool TakeStatusRequest() { return status_requested_.exchange(false); }
    bool QuitRequested() const { return quit_requested_; }

private:
    std::mutex mutex_;
    std::optional<Mode> pending_;
    std::atomic<bool> status_requested_{false};
    std::atomic<bool> quit_requested_{false};
};

// Interprets one console line. Returns false for unknown commands.
bool HandleCommand(const std::string& command, ModeSwitch& mode_switch, std::ostream& out);

/**
 * @class ConsoleReader
 * @brief Feeds console lines into a ModeSwitch from a background thread.
 *
 * The thread waits on poll_fd with a short timeout so it can notice a quit
 * request without a pending line. A negative poll_fd reads only what the
 * stream already buffers. The destructor requests quit and joins.
 */
class ConsoleReader {
public:
    ConsoleReader(ModeSwitch& mode_switch, std::istream& in, std::ostream& out, int poll_fd = STDIN_FILENO);
    ~ConsoleReader();

    ConsoleReader(const ConsoleReader&) = delete;
    ConsoleReader& operator=(const ConsoleReader&) = delete;

private:
    void ReadLoop();
    bool WaitForInput();

    ModeSwitch& mode_switch_;
    std::istream& in_;
    std::ostream& out_;
    int poll_fd_;
    std::thread thread_;
};
