#include "bots.hh"

#include <chrono>
#include <gtest/gtest.h>
#include <minuniq/game/client.hh>
#include <minuniq/game/round.hh>
#include <utility>

using minuniq::game::Client;
using minuniq::game::SENTINEL;
using std::chrono::milliseconds;
using State = Client::State;

// NOLINTNEXTLINE
TEST(client, full_exchange) {
    auto client = make_client("bot", fixed_value_bot(5));
    ASSERT_EQ(client.state(), State::Init);
    ASSERT_EQ(client.value(), SENTINEL);
    client.poll();
    ASSERT_EQ(client.state(), State::AwaitingStart);
    client.send_game();
    ASSERT_EQ(client.state(), State::AwaitingValue);
    client.poll();
    ASSERT_EQ(client.state(), State::AwaitingRoundEnd);
    ASSERT_EQ(client.value(), 5U);
    client.send_values({5, 2});
    ASSERT_EQ(client.state(), State::AwaitingStart);
    client.send_game();
    client.poll();
    ASSERT_EQ(client.value(), 5U);
    client.send_values({5, 5});
    client.send_end();
    ASSERT_EQ(client.state(), State::Ended);
    ASSERT_EQ(client.name(), "bot");
}

// NOLINTNEXTLINE
TEST(client, poll_is_no_op_outside_reading_states) {
    auto client = make_client("bot", fixed_value_bot(5));
    client.poll();
    ASSERT_EQ(client.state(), State::AwaitingStart);
    client.poll();
    ASSERT_EQ(client.state(), State::AwaitingStart);
}

// NOLINTNEXTLINE
TEST(client, exit_before_ready) {
    auto client = make_client("bot", "exit 0", SHORT_DEADLINES);
    client.poll();
    ASSERT_TRUE(client.is_error());
    ASSERT_EQ(client.value(), SENTINEL);
}

// NOLINTNEXTLINE
TEST(client, unknown_handshake_message) {
    auto client = make_client("bot", "echo hello; exec sleep 30", SHORT_DEADLINES);
    client.poll();
    ASSERT_TRUE(client.is_error());
}

// NOLINTNEXTLINE
TEST(client, handshake_timeout_keeps_client_initializing) {
    auto client = make_client("bot", "exec sleep 30", SHORT_DEADLINES);
    client.poll();
    ASSERT_TRUE(client.is_init());
    ASSERT_EQ(client.value(), SENTINEL);
    // Requesting a value from a client that is still initializing is allowed
    client.send_game();
    ASSERT_EQ(client.state(), State::AwaitingValue);
    client.poll();
    ASSERT_TRUE(client.is_error());
    ASSERT_EQ(client.value(), SENTINEL);
}

// NOLINTNEXTLINE
TEST(client, late_ready_is_not_a_value) {
    auto client = make_client(
        "bot",
        "sleep 1; echo ready; exec sleep 30",
        {.handshake = milliseconds{100}, .read = milliseconds{5000}, .write = milliseconds{100}}
    );
    client.poll();
    ASSERT_TRUE(client.is_init());
    client.send_game();
    client.poll();
    ASSERT_TRUE(client.is_error());
    ASSERT_EQ(client.value(), SENTINEL);
}

// NOLINTNEXTLINE
TEST(client, non_numeric_value) {
    auto client =
        make_client("bot", "echo ready; read -r line; echo abc; exec sleep 30", SHORT_DEADLINES);
    client.poll();
    client.send_game();
    client.poll();
    ASSERT_TRUE(client.is_error());
    ASSERT_EQ(client.value(), SENTINEL);
}

// NOLINTNEXTLINE
TEST(client, negative_value) {
    auto client = make_client(
        "bot", "echo ready; read -r line; printf '%s\\n' -5; exec sleep 30", SHORT_DEADLINES
    );
    client.poll();
    client.send_game();
    client.poll();
    ASSERT_TRUE(client.is_error());
}

// NOLINTNEXTLINE
TEST(client, value_timeout) {
    auto client = make_client("bot", "echo ready; read -r line; exec sleep 30", SHORT_DEADLINES);
    client.poll();
    ASSERT_EQ(client.state(), State::AwaitingStart);
    client.send_game();
    client.poll();
    ASSERT_TRUE(client.is_error());
    ASSERT_EQ(client.value(), SENTINEL);
}

// NOLINTNEXTLINE
TEST(client, value_is_reset_on_error) {
    auto client = make_client(
        "bot",
        "echo ready; read -r line; echo 7; read -r line; read -r line; exit 0",
        SHORT_DEADLINES
    );
    client.poll();
    client.send_game();
    client.poll();
    ASSERT_EQ(client.value(), 7U);
    client.send_values({7});
    client.send_game();
    client.poll();
    ASSERT_TRUE(client.is_error());
    ASSERT_EQ(client.value(), SENTINEL);
}

// NOLINTNEXTLINE
TEST(client, write_to_closed_stdin) {
    auto client = make_client("bot", "exec 0<&-; echo ready; exec sleep 30", SHORT_DEADLINES);
    client.poll();
    ASSERT_EQ(client.state(), State::AwaitingStart);
    client.send_game();
    ASSERT_TRUE(client.is_error());
}

// NOLINTNEXTLINE
TEST(client, error_is_absorbing) {
    auto client = make_client("bot", "exit 0", SHORT_DEADLINES);
    client.poll();
    ASSERT_TRUE(client.is_error());
    client.send_game();
    ASSERT_TRUE(client.is_error());
    client.poll();
    ASSERT_TRUE(client.is_error());
    client.send_values({1, 2});
    ASSERT_TRUE(client.is_error());
    client.send_end();
    ASSERT_TRUE(client.is_error());
    ASSERT_EQ(client.value(), SENTINEL);
}

// NOLINTNEXTLINE
TEST(client, end_from_init) {
    auto client = make_client("bot", "exec sleep 30", SHORT_DEADLINES);
    client.send_end();
    ASSERT_EQ(client.state(), State::Ended);
    client.send_game();
    ASSERT_EQ(client.state(), State::Ended);
}

// NOLINTNEXTLINE
TEST(client, move_keeps_state) {
    auto client = make_client("bot", fixed_value_bot(3));
    client.poll();
    auto moved = std::move(client);
    ASSERT_EQ(moved.state(), State::AwaitingStart);
    moved.send_game();
    moved.poll();
    ASSERT_EQ(moved.value(), 3U);
}

// NOLINTNEXTLINE
TEST(client, state_names) {
    ASSERT_STREQ(to_string(State::Init), "Init");
    ASSERT_STREQ(to_string(State::AwaitingRoundEnd), "AwaitingRoundEnd");
    ASSERT_STREQ(to_string(State::Error), "Error");
}
