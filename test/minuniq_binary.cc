#include "temporary_file.hh"

#include <gtest/gtest.h>
#include <minuniq/game/client.hh>
#include <minuniq/process.hh>
#include <minuniq/sandbox/launcher.hh>
#include <minuniq/script/python.hh>
#include <string>
#include <utility>
#include <vector>

using minuniq::spawn;
using minuniq::game::Client;
using minuniq::sandbox::HostDirect;

namespace {

// Runs the minuniq binary and returns its exit code
int run_minuniq(std::vector<std::string> args, bool execute_mode) {
    args.insert(args.begin(), MINUNIQ_BINARY);
    auto spawned = spawn({
        .argv = std::move(args),
        .extra_env = {execute_mode ? "__RUN__=1" : "MINUNIQ_TEST_UNUSED=1"},
    });
    return spawned.process.wait().exit_code();
}

constexpr auto python_bot = R"(import sys
print("ready", flush=True)
for line in sys.stdin:
    line = line.strip()
    if line == "game":
        print(13, flush=True)
    elif line == "end":
        break
)";

} // namespace

// NOLINTNEXTLINE
TEST(minuniq_binary, execute_mode_forwards_exit_code) {
    if (not minuniq::script::Python{}.is_supported()) {
        GTEST_SKIP() << "python3 is not installed";
    }
    TemporaryFile script{"/tmp/minuniq-test-binary.XXXXXX.py", "raise SystemExit(42)\n"};
    ASSERT_EQ(run_minuniq({script.path()}, true), 42);
}

// NOLINTNEXTLINE
TEST(minuniq_binary, execute_mode_errors) {
    ASSERT_EQ(run_minuniq({}, true), 1);
    ASSERT_EQ(run_minuniq({"/tmp/minuniq-test-bot.rb"}, true), 1);
}

// NOLINTNEXTLINE
TEST(minuniq_binary, usage_without_config) {
    ASSERT_EQ(run_minuniq({}, false), 1);
    ASSERT_EQ(run_minuniq({"/nonexistent/minuniq-config.yaml"}, false), 1);
}

// NOLINTNEXTLINE
TEST(minuniq_binary, host_direct_client) {
    if (not minuniq::script::Python{}.is_supported()) {
        GTEST_SKIP() << "python3 is not installed";
    }
    TemporaryFile script{"/tmp/minuniq-test-binary.XXXXXX.py", python_bot};
    auto client = Client::launch(HostDirect{.executable = MINUNIQ_BINARY}, script.path(), {});
    client.poll();
    ASSERT_EQ(client.state(), Client::State::AwaitingStart);
    client.send_game();
    client.poll();
    ASSERT_EQ(client.state(), Client::State::AwaitingRoundEnd);
    ASSERT_EQ(client.value(), 13U);
    client.send_values({13});
    client.send_end();
    ASSERT_EQ(client.state(), Client::State::Ended);
}
