#include "minuniq/game/match.hh"
#include "minuniq/logger.hh"

#include <utility>

namespace minuniq::game {

std::vector<Client> launch_clients(
    const sandbox::Strategy& strategy,
    const std::vector<std::string>& script_paths,
    Client::Deadlines deadlines
) {
    std::vector<Client> clients;
    clients.reserve(script_paths.size());
    for (auto const& path : script_paths) {
        clients.emplace_back(Client::launch(strategy, path, deadlines));
    }
    return clients;
}

Match::Match(std::vector<Client> clients)
: clients_{std::move(clients)}
, scores_(clients_.size(), 0) {}

void Match::wait_ready() {
    stdlog("waiting for readiness");
    for (auto& client : clients_) {
        client.poll();
        if (client.is_init()) {
            stdlog("client ", client.name(), " still initializing");
        }
    }
    stdlog("wait done");
}

RoundOutcome Match::play_round() {
    std::vector<Value> values;
    values.reserve(clients_.size());
    for (auto& client : clients_) {
        client.send_game();
        client.poll();
        values.emplace_back(client.value());
    }
    for (auto& client : clients_) {
        client.send_values(values);
    }

    auto outcome = compute_round_outcome(values);
    if (auto winner = outcome.winner()) {
        stdlog("winner is client #", *winner);
        ++scores_[*winner];
    } else {
        stdlog("All bots lost");
    }
    ++rounds_played_;
    return outcome;
}

void Match::play_rounds(uint32_t rounds) {
    for (uint32_t i = 0; i < rounds; ++i) {
        stdlog("Round #", i);
        play_round();
    }
}

void Match::finish() {
    for (size_t i = 0; i < clients_.size(); ++i) {
        clients_[i].send_end();
        stdlog("Client #", i, " (", clients_[i].name(), ") - ", scores_[i], " points");
    }
}

} // namespace minuniq::game
