//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_AUDITLOGGER_HPP
#define FASTTRACK_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <span>
#include <string>
#include <string_view>

#include "../core/Events.hpp"
#include "../core/Reducer.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace fasttrack::core::debug
{
    // Plain-text transcript of one game, one line per record.
    class AuditLogger
    {
    public:
        AuditLogger(std::string path, Board const& board);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = delete;

        // Session header (seed, seat order)
        auto start(GameStarted const& g) -> void;

        // Applied event with the hash of the state it produced
        auto event(Event const& e, std::uint64_t hash) -> void;
        auto effects(std::span<Effect const> fx) -> void;

        // Event refused by the reducer, with every violation
        auto rejection(Event const& e, Rejection const& r) -> void;

        // Internal faults and sync divergences
        auto fault(std::string_view what) -> void;

        // Flag repairs made by the audit pass
        auto correction(std::string_view what) -> void;

        // Game end footer (winner seat; -1 if none)
        auto end(GameState const& s) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
        Board const& board_;
    };

    auto DescribeEvent(Event const& e, Board const& board) -> std::string;
}

#endif //FASTTRACK_AUDITLOGGER_HPP
