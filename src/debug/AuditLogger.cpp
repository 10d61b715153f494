#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <vector>

#include "../core/Cards.hpp"

using namespace fasttrack::core;

namespace
{

auto s_move(MoveType const t) -> std::string_view
{
    switch (t)
    {
        case MoveType::Enter:            return "Enter";
        case MoveType::Advance:          return "Advance";
        case MoveType::Retreat:          return "Retreat";
        case MoveType::EnterShortcut:    return "EnterShortcut";
        case MoveType::ContinueShortcut: return "ContinueShortcut";
        case MoveType::LeaveShortcut:    return "LeaveShortcut";
        case MoveType::EnterCaptureHole: return "EnterCaptureHole";
        case MoveType::ExitCaptureHole:  return "ExitCaptureHole";
    }
    return "?";
}

auto s_path(std::vector<HoleId> const& path, Board const& board) -> std::string
{
    std::string body;
    for (size_t i{}; i < path.size(); ++i)
    {
        body += (i ? ">" : "");
        body += board.Contains(path[i]) ? board.Name(path[i]) : std::format("#{}", path[i]);
    }
    return body;
}

auto s_hole(HoleId const h, Board const& board) -> std::string
{
    return board.Contains(h) ? board.Name(h) : std::format("#{}", h);
}

} // anonymous namespace

namespace fasttrack::core::debug
{

auto DescribeEvent(Event const& e, Board const& board) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& ev) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayerJoined>)
            {
                return std::format("PlayerJoined(P{})", static_cast<int>(ev.seat));
            }
            else if constexpr (std::is_same_v<T, GameStarted>)
            {
                std::string order;
                for (size_t i{}; i < ev.player_order.size(); ++i)
                {
                    order += std::format("{}P{}", (i ? "," : ""), static_cast<int>(ev.player_order[i]));
                }
                return std::format("GameStarted(seed={}, order=[{}])", ev.seed, order);
            }
            else if constexpr (std::is_same_v<T, CardDrawn>)
            {
                return std::format("CardDrawn(P{})", static_cast<int>(ev.seat));
            }
            else if constexpr (std::is_same_v<T, MovePlayed> || std::is_same_v<T, SplitMovePlayed>)
            {
                return std::format("{}(P{}, piece={}, {}, [{}])",
                                   std::is_same_v<T, MovePlayed> ? "MovePlayed" : "SplitMovePlayed",
                                   static_cast<int>(ev.seat), static_cast<int>(ev.piece), s_move(ev.type),
                                   s_path(ev.path, board));
            }
            else
            {
                return std::format("TurnEnded(P{})", static_cast<int>(ev.seat));
            }
        },
        e.payload
    );
}

AuditLogger::AuditLogger(std::string path, Board const& board)
    : out_(std::move(path), std::ios::out | std::ios::trunc),
      board_(board)
{
    if (!out_)
    {
        FTK_THROW(error::Code::Unknown, "Audit transcript could not be opened");
    }
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameStarted const& g) -> void
{
    out_ << std::format("Seed={}\n", g.seed);
    out_ << std::format("Players={}\n", g.player_order.size());
    out_ << std::format("Sections={} Perimeter={}\n", board_.Sections(), board_.PerimeterSize());
    out_.flush();
}

auto AuditLogger::event(Event const& e, std::uint64_t hash) -> void
{
    out_ << std::format("#{} {} hash={:016x}\n", e.sequence, DescribeEvent(e, board_), hash);
}

auto AuditLogger::effects(std::span<Effect const> fx) -> void
{
    for (Effect const& f : fx)
    {
        std::string line = std::format("  - {}", ToString(f.kind));
        if (f.seat)  line += std::format(" P{}", static_cast<int>(*f.seat));
        if (f.piece) line += std::format(" piece={}", static_cast<int>(*f.piece));
        if (f.other) line += std::format(" other={}", static_cast<int>(*f.other));
        if (f.hole)  line += std::format(" at={}", s_hole(*f.hole, board_));
        if (f.card)  line += std::format(" card={}", ToString(*f.card));
        out_ << line << '\n';
    }
}

auto AuditLogger::rejection(Event const& e, Rejection const& r) -> void
{
    out_ << std::format("#{} REJECTED {} [{}] {}\n",
                        e.sequence, DescribeEvent(e, board_), error::to_string(r.code), r.message);
    for (error::RuleViolation const& v : r.violations)
    {
        out_ << std::format("  ! {}\n", error::describe(v));
    }
}

auto AuditLogger::fault(std::string_view what) -> void
{
    out_ << std::format("FAULT {}\n", what);
    out_.flush();
}

auto AuditLogger::correction(std::string_view what) -> void
{
    out_ << std::format("AUDIT {}\n", what);
}

auto AuditLogger::end(GameState const& s) -> void
{
    int const winner = s.winner ? static_cast<int>(*s.winner) : -1;
    out_ << std::format("Turns={}\n", s.turn.number);
    out_ << std::format("Winner={}\n", winner);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace fasttrack::core::debug
