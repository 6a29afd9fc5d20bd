#include "mode_switch.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <poll.h>

void ModeSwitch::Request(Mode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_ = mode;
}

bool ModeSwitch::ApplyPending(EncounterState& state) {
    std::optional<Mode> requested;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requested.swap(pending_);
    }
    if (!requested || *requested == state.mode) return false;
    state.mode = *requested;
    return true;
}

bool HandleCommand(const std::string& command, ModeSwitch& mode_switch, std::ostream& out) {
    if (command == "start" || command == "s" || command == "S") {
        mode_switch.Request(Mode::Walk);
    } else if (command == "pause" || command == "p") {
        mode_switch.Request(Mode::Pause);
    } else if (command == "status") {
        mode_switch.RequestStatus();
    } else if (command == "quit" || command == "q") {
        mode_switch.RequestQuit();
    } else if (command == "help" || command == "h") {
        out << "Commands:\n"
            << "  start (s)  - Start or resume tracking\n"
            << "  pause (p)  - Pause tracking\n"
            << "  status     - Show encounter status\n"
            << "  quit (q)   - Save and exit\n"
            << "  help (h)   - Show this help\n" << std::endl;
    } else if (!command.empty()) {
        return false;
    }
    return true;
}

ConsoleReader::ConsoleReader(ModeSwitch& mode_switch, std::istream& in, std::ostream& out, int poll_fd)
    : mode_switch_(mode_switch), in_(in), out_(out), poll_fd_(poll_fd) {
    thread_ = std::thread(&ConsoleReader::ReadLoop, this);
}

ConsoleReader::~ConsoleReader() {
    mode_switch_.RequestQuit();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ConsoleReader::ReadLoop() {
    std::string command;
    while (!mode_switch_.QuitRequested()) {
        if (!WaitForInput()) continue;
        if (!std::getline(in_, command)) break;
        if (!HandleCommand(command, mode_switch_, out_)) {
            out_ << "Unknown command: " << command << " (try 'help')" << std::endl;
        }
    }
}

// True when a line can be read without blocking past the poll timeout.
bool ConsoleReader::WaitForInput() {
    if (in_.rdbuf()->in_avail() > 0) return true;
    if (poll_fd_ < 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return false;
    }

    pollfd fds{poll_fd_, POLLIN, 0};
    int ready = poll(&fds, 1, 200);
    if (ready < 0) {
        if (errno == EINTR) return false;
        std::cerr << "[Console] poll failed: " << std::strerror(errno) << std::endl;
        mode_switch_.RequestQuit();
        return false;
    }
    return ready > 0;
}
