#pragma once

#include <chrono>
#include <cstdint>
#include <minuniq/game/line_io.hh>
#include <minuniq/game/round.hh>
#include <minuniq/process.hh>
#include <minuniq/sandbox/launcher.hh>
#include <string>
#include <string_view>
#include <vector>

namespace minuniq::game {

// Time limits of a single exchange with a competitor
struct ClientDeadlines {
    std::chrono::milliseconds handshake{10'000};
    std::chrono::milliseconds read{1000};
    std::chrono::milliseconds write{100};
};

// Talks to one competitor process over its stdin and stdout. Owns the process: it is killed and
// reaped on destruction, whatever state the client ended in.
class Client {
public:
    // State automaton (Error is absorbing, every non-terminal state moves to Ended on
    // send_end()):
    //
    //                read "ready"                 send_game()
    // --> Init ---------------------> AwaitingStart -----------> AwaitingValue
    //      | \                              ^                        |
    //      |  `-----------------------------|------------------------'
    //      |          send_game()           |  send_values()         | read a value
    //      |                                 `------------------ AwaitingRoundEnd
    //      `--> Error (other line, end of file, i/o error; in AwaitingValue also timeout)
    enum class State : uint8_t {
        Init,
        Error,
        AwaitingStart,
        AwaitingValue,
        AwaitingRoundEnd,
        Ended,
    };

    using Deadlines = ClientDeadlines;

private:
    std::string name_;
    Process process_; // declared before the streams so that they are closed before the kill
    LineReader reader_;
    LineWriter writer_;
    Deadlines deadlines_;
    State state_ = State::Init;
    Value value_ = SENTINEL;

public:
    Client(std::string name, Spawned spawned, Deadlines deadlines = {}) noexcept;

    // Starts the script under @p strategy, the client is named after the script path.
    // Throws on error.
    static Client
    launch(const sandbox::Strategy& strategy, const std::string& script_path, Deadlines deadlines);

    Client(const Client&) = delete;
    Client(Client&&) noexcept = default;
    Client& operator=(const Client&) = delete;
    Client& operator=(Client&&) noexcept = default;
    ~Client() = default;

    // Reads at most one line, only in Init and AwaitingValue; no-op in other states.
    // A handshake timeout leaves the client in Init.
    void poll();

    // Requests a value (allowed in Init and AwaitingStart)
    void send_game();

    // Sends all values of the round, closing the AwaitingRoundEnd phase
    void send_values(const std::vector<Value>& values);

    void send_end();

    [[nodiscard]] bool is_init() const noexcept { return state_ == State::Init; }

    [[nodiscard]] bool is_error() const noexcept { return state_ == State::Error; }

    [[nodiscard]] State state() const noexcept { return state_; }

    // The last successfully read value or SENTINEL if the client errored or never sent one
    [[nodiscard]] Value value() const noexcept { return value_; }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void handle_line(const std::string& line);

    void fail() noexcept;

    // Returns true on success, on failure moves to Error
    bool send_line(std::string_view line);
};

[[nodiscard]] const char* to_string(Client::State state) noexcept;

} // namespace minuniq::game
