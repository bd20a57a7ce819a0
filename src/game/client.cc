#include "minuniq/debug.hh"
#include "minuniq/game/client.hh"
#include "minuniq/logger.hh"
#include "minuniq/overloaded.hh"
#include "minuniq/sandbox/launcher.hh"

#include <cassert>
#include <string>
#include <utility>
#include <variant>

namespace {

constexpr DebugLogger<false> debuglog{};

} // namespace

namespace minuniq::game {

const char* to_string(Client::State state) noexcept {
    switch (state) {
    case Client::State::Init: return "Init";
    case Client::State::Error: return "Error";
    case Client::State::AwaitingStart: return "AwaitingStart";
    case Client::State::AwaitingValue: return "AwaitingValue";
    case Client::State::AwaitingRoundEnd: return "AwaitingRoundEnd";
    case Client::State::Ended: return "Ended";
    }
    return "unknown";
}

Client::Client(std::string name, Spawned spawned, Deadlines deadlines) noexcept
: name_{std::move(name)}
, process_{std::move(spawned.process)}
, reader_{std::move(spawned.stdout_fd)}
, writer_{std::move(spawned.stdin_fd)}
, deadlines_{deadlines} {}

Client Client::launch(
    const sandbox::Strategy& strategy, const std::string& script_path, Deadlines deadlines
) {
    return Client{script_path, sandbox::launch(strategy, script_path), deadlines};
}

void Client::poll() {
    if (state_ != State::Init and state_ != State::AwaitingValue) {
        return;
    }
    auto timeout = state_ == State::Init ? deadlines_.handshake : deadlines_.read;
    std::visit(
        overloaded{
            [&](const std::string& line) {
                debuglog("client ", name_, " -> ", line);
                handle_line(line);
            },
            [&](IoError err) {
                if (state_ == State::Init and err == IoError::Timeout) {
                    // Not fatal: the late "ready" or the silence is caught by the first value
                    // read
                    errlog("client ", name_, ": no `ready` within ", timeout.count(), " ms");
                    return;
                }
                errlog("client ", name_, ": failed to read line: ", to_string(err));
                if (err == IoError::Timeout) {
                    // A late line must not be taken for the answer to a later request
                    reader_.close();
                }
                fail();
            },
        },
        reader_.read_line(timeout)
    );
}

void Client::handle_line(const std::string& line) {
    switch (state_) {
    case State::Init:
        if (line == "ready") {
            state_ = State::AwaitingStart;
        } else {
            errlog("client ", name_, ": unknown message when waiting for `ready`: ", line);
            fail();
        }
        return;
    case State::AwaitingValue:
        if (auto val = parse_value(line)) {
            value_ = *val;
            state_ = State::AwaitingRoundEnd;
        } else {
            errlog("client ", name_, ": got '", line, "' which is not a number");
            fail();
        }
        return;
    case State::Error:
    case State::AwaitingStart:
    case State::AwaitingRoundEnd:
    case State::Ended: break;
    }
    assert(false && "lines are read only in Init and AwaitingValue");
}

void Client::send_game() {
    if (state_ == State::Error or state_ == State::Ended) {
        return;
    }
    assert(state_ == State::Init or state_ == State::AwaitingStart);
    if (send_line("game\n")) {
        state_ = State::AwaitingValue;
    }
}

void Client::send_values(const std::vector<Value>& values) {
    if (state_ == State::Error or state_ == State::Ended) {
        return;
    }
    assert(state_ == State::AwaitingRoundEnd);
    if (send_line(format_values(values) + '\n')) {
        state_ = State::AwaitingStart;
    }
}

void Client::send_end() {
    if (state_ == State::Error or state_ == State::Ended) {
        return;
    }
    if (send_line("end\n")) {
        state_ = State::Ended;
    }
}

void Client::fail() noexcept {
    state_ = State::Error;
    value_ = SENTINEL;
}

bool Client::send_line(std::string_view line) {
    debuglog("client ", name_, " <- ", line);
    if (auto err = writer_.write(line, deadlines_.write)) {
        errlog("client ", name_, ": failed to write line: ", to_string(*err));
        if (*err == IoError::Timeout) {
            writer_.close();
        }
        fail();
        return false;
    }
    return true;
}

} // namespace minuniq::game
