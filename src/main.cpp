//
// Created by Malik T on 19/10/2026.
//

//
// main.cpp: seeded self-play through two synchronized peers over an in-memory loopback
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <deque>
#include <filesystem>
#include <format>
#include <memory>
#include <numeric>
#include <print>
#include <string>
#include <vector>

#include "core/Exception.hpp"
#include "core/RandomAi.hpp"
#include "core/Reducer.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/Invariants.hpp"
#include "net/SyncSession.hpp"
#include "net/codec.hpp"

namespace
{
    struct SimConfig
    {
        std::uint32_t n_players{4};
        std::uint64_t seed{123456789ULL};
        std::uint32_t games{1};
        std::uint32_t checkpoint{16};
        std::uint32_t max_turns{5000};
        std::string log_dir{"_artifacts"};
        bool transcript{true};
        fasttrack::core::ForcedExitRule forced_exit{fasttrack::core::ForcedExitRule::DemoteInPlace};
    };

    auto ParseArgs(int argc, char** argv) -> SimConfig
    {
        SimConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--players")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.n_players = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--games")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.games = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--checkpoint")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.checkpoint = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--max-turns")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.max_turns = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--log")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.transcript = (v != 0); }
            }
            else if (arg == "--log-dir")
            {
                if (i + 1 < argc) { cfg.log_dir = argv[++i]; }
            }
            else if (arg == "--forced-exit")
            {
                if (i + 1 < argc)
                {
                    std::string const mode = argv[++i];
                    cfg.forced_exit = (mode == "next")
                                          ? fasttrack::core::ForcedExitRule::NextPerimeterHole
                                          : fasttrack::core::ForcedExitRule::DemoteInPlace;
                }
            }
        }
        return cfg;
    }

    // Every frame a peer sends lands in the inbox of every other peer.
    class LoopbackSink final : public fasttrack::net::EventSink
    {
    public:
        explicit LoopbackSink(std::size_t peers) :
            inbox_(peers) {}

        auto Deliver(std::uint8_t from, std::vector<std::uint8_t> bytes) -> void override
        {
            for (std::size_t p = 0; p < inbox_.size(); ++p)
            {
                if (p != from) inbox_[p].push_back(bytes);
            }
        }

        auto Pop(std::size_t peer, std::vector<std::uint8_t>& out) -> bool
        {
            if (inbox_[peer].empty()) return false;
            out = std::move(inbox_[peer].front());
            inbox_[peer].pop_front();
            return true;
        }

    private:
        std::vector<std::deque<std::vector<std::uint8_t>>> inbox_;
    };

    // Delivers queued frames until every inbox is empty. A diverged peer is resynced from the host.
    auto Pump(LoopbackSink& sink, std::vector<std::unique_ptr<fasttrack::net::SyncSession>>& peers) -> void
    {
        bool moved = true;
        std::vector<std::uint8_t> frame;
        while (moved)
        {
            moved = false;
            for (std::size_t p = 0; p < peers.size(); ++p)
            {
                while (sink.Pop(p, frame))
                {
                    moved = true;
                    auto const r = peers[p]->Receive(frame);
                    if (r || r.error().code != fasttrack::core::error::Code::SyncDiverged) continue;

                    std::print("[ftsim] peer {} diverged: {}\n", p, fasttrack::net::Describe(r.error()));
                    if (p == 0) FTK_THROW(fasttrack::core::error::Code::SyncDiverged, "host diverged from a guest");
                    if (auto ok = peers[p]->ResyncFrom(peers[0]->Log()); !ok)
                        FTK_THROW(fasttrack::core::error::Code::SyncDiverged,
                                  std::format("resync failed: {}", ok.error().message));
                }
            }
        }
    }

    auto Submit(fasttrack::net::SyncSession& peer, fasttrack::core::EventPayload payload) -> void
    {
        auto const r = peer.SubmitLocal(std::move(payload));
        if (!r)
        {
            std::string msg = r.error().message;
            for (auto const& v : r.error().violations) msg += "\n  " + fasttrack::core::error::describe(v);
            FTK_THROW(r.error().code, msg);
        }
    }

    auto PlayOne(SimConfig const& sc, std::uint64_t seed) -> fasttrack::core::GameState
    {
        using namespace fasttrack::core;

        Config cfg{};
        cfg.forced_exit = sc.forced_exit;
        Reducer const reducer(cfg);

        std::unique_ptr<debug::AuditLogger> log;
        if (sc.transcript)
        {
            log = std::make_unique<debug::AuditLogger>(
                std::format("{}/game_{}.log", sc.log_dir, seed), reducer.GetBoard());
        }

        LoopbackSink sink(2);
        std::vector<std::unique_ptr<fasttrack::net::SyncSession>> peers;
        peers.push_back(std::make_unique<fasttrack::net::SyncSession>(0, reducer, sink, sc.checkpoint, log.get()));
        peers.push_back(std::make_unique<fasttrack::net::SyncSession>(1, reducer, sink, sc.checkpoint));

        std::vector<SeatT> order(sc.n_players);
        std::iota(order.begin(), order.end(), SeatT{0});

        std::vector<std::unique_ptr<Player>> players;
        for (SeatT const seat : order)
        {
            players.emplace_back(std::make_unique<RandomAI>(seat, seed + static_cast<uint64_t>(seat * 1337u)));
            Submit(*peers[0], PlayerJoined{.seat = seat});
        }
        GameStarted const start{.seed = seed, .player_order = order};
        if (log) log->start(start);
        Submit(*peers[0], start);
        Pump(sink, peers);

        while (peers[0]->State().phase != Phase::GameWon && peers[0]->State().turn.number <= sc.max_turns)
        {
            SeatT const seat = ActivePlayer(peers[0]->State()).seat;
            auto& peer = *peers[seat % peers.size()];

            GameState const& s = peer.State();
            std::vector<Candidate> const legal = reducer.LegalMoves(s);
            Submit(peer, players[seat]->Play(s, legal));
            debug::CheckInvariants(reducer, peer.State());
            Pump(sink, peers);
        }

        if (peers[0]->CurrentHash() != peers[1]->CurrentHash())
            FTK_THROW(error::Code::SyncDiverged, "peers finished with different states");

        GameState const final_state = peers[0]->State();
        if (log) log->end(final_state);
        fasttrack::core::net::WriteEventLog(std::format("{}/game_{}.ftlog", sc.log_dir, seed), peers[0]->Log());
        return final_state;
    }
}

int main(int argc, char** argv)
{
    using namespace fasttrack::core;

    SimConfig const sc = ParseArgs(argc, argv);

    std::print("[ftsim] {} game(s), {} player(s), seed {}\n", sc.games, sc.n_players, sc.seed);

    try
    {
        std::filesystem::create_directories(sc.log_dir);
        for (std::uint32_t g = 0; g < sc.games; ++g)
        {
            std::uint64_t const seed = sc.seed + g;
            GameState const s = PlayOne(sc, seed);
            if (s.winner)
                std::print("[ftsim] seed {}: P{} won after {} turns\n", seed, static_cast<int>(*s.winner), s.turn.number);
            else
                std::print("[ftsim] seed {}: no winner after {} turns\n", seed, s.turn.number);
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "{}", e);
        return 1;
    }
    catch (std::filesystem::filesystem_error const& e)
    {
        std::print(stderr, "[ftsim] {}\n", e.what());
        return 1;
    }

    return 0;
}
