#pragma once

#include <cstdint>
#include <minuniq/game/client.hh>
#include <minuniq/game/round.hh>
#include <minuniq/sandbox/launcher.hh>
#include <string>
#include <vector>

namespace minuniq::game {

// Launches one client per script, in order. Throws on the first setup failure; the clients
// launched so far are killed and reaped.
[[nodiscard]] std::vector<Client> launch_clients(
    const sandbox::Strategy& strategy,
    const std::vector<std::string>& script_paths,
    Client::Deadlines deadlines = {}
);

// Runs rounds sequentially, contacting one client at a time. Index of a client in the match is
// its identity in the broadcast values and in the scores.
class Match {
    std::vector<Client> clients_;
    std::vector<uint32_t> scores_; // scores_[i] belongs to clients_[i]
    uint32_t rounds_played_ = 0;

public:
    explicit Match(std::vector<Client> clients);

    // A single poll pass over all clients; clients still in Init are only reported
    void wait_ready();

    // Collects the values, broadcasts them and credits the winner (if any)
    RoundOutcome play_round();

    void play_rounds(uint32_t rounds);

    // Sends the end of the match to every client not in Error and reports the scores
    void finish();

    [[nodiscard]] const std::vector<Client>& clients() const noexcept { return clients_; }

    [[nodiscard]] const std::vector<uint32_t>& scores() const noexcept { return scores_; }

    [[nodiscard]] uint32_t rounds_played() const noexcept { return rounds_played_; }
};

} // namespace minuniq::game
