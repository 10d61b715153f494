//
// Created by Malik T on 19/10/2026.
//

//
// ReplayMain.cpp: folds a recorded event log and prints the state hash after every event
//

#include <cstdint>
#include <print>
#include <string>

#include "core/Exception.hpp"
#include "core/Reducer.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/Invariants.hpp"
#include "net/codec.hpp"

namespace
{
    struct ReplayConfig
    {
        std::string path;
        fasttrack::core::ForcedExitRule forced_exit{fasttrack::core::ForcedExitRule::DemoteInPlace};
        bool quiet{false};
    };

    auto ParseArgs(int argc, char** argv) -> ReplayConfig
    {
        ReplayConfig cfg{};
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "--forced-exit")
            {
                if (i + 1 < argc)
                {
                    std::string const mode = argv[++i];
                    cfg.forced_exit = (mode == "next")
                                          ? fasttrack::core::ForcedExitRule::NextPerimeterHole
                                          : fasttrack::core::ForcedExitRule::DemoteInPlace;
                }
            }
            else if (arg == "--quiet")
            {
                cfg.quiet = true;
            }
            else
            {
                cfg.path = std::move(arg);
            }
        }
        return cfg;
    }
}

int main(int argc, char** argv)
{
    using namespace fasttrack::core;

    ReplayConfig const rc = ParseArgs(argc, argv);
    if (rc.path.empty())
    {
        std::print(stderr, "usage: fasttrack_replay <log.ftlog> [--forced-exit demote|next] [--quiet]\n");
        return 2;
    }

    auto const events = net::ReadEventLog(rc.path);
    if (!events)
    {
        std::print(stderr, "[ftreplay] {}: {}\n", rc.path, events.error().message);
        return 1;
    }

    try
    {
        Config cfg{};
        cfg.forced_exit = rc.forced_exit;
        Reducer const reducer(cfg);

        GameState s{};
        for (Event const& e : *events)
        {
            auto r = reducer.Apply(s, e);
            if (!r)
            {
                std::print(stderr, "[ftreplay] #{} rejected [{}] {}\n", e.sequence, error::to_string(r.error().code),
                           r.error().message);
                for (error::RuleViolation const& v : r.error().violations)
                    std::print(stderr, "  {}\n", error::describe(v));
                return 1;
            }
            s = std::move(r->state);
            debug::CheckInvariants(reducer, s);
            if (!rc.quiet)
                std::print("#{} {:016x} {}\n", e.sequence, net::ComputeStateHash(s),
                           debug::DescribeEvent(e, reducer.GetBoard()));
        }

        std::print("[ftreplay] {} events, final hash {:016x}, winner {}\n", events->size(),
                   net::ComputeStateHash(s), s.winner ? std::format("P{}", static_cast<int>(*s.winner)) : "none");
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "{}", e);
        return 1;
    }
    return 0;
}
