//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_CODEC_HPP
#define FASTTRACK_CODEC_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <variant>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Board.hpp"
#include "../core/Events.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/fasttrack_net_generated.h"

namespace fasttrack::core::net
{
    inline constexpr std::uint16_t SchemaVersion = 1;

    struct ParseError
    {
        std::string message;
    };

    // Hash of the state recorded by a peer after applying event `sequence`.
    struct SyncRequest
    {
        std::uint64_t sequence{};
        std::uint64_t hash{};
    };

    struct SyncResponse
    {
        std::uint64_t sequence{};
        std::uint64_t hash{};
    };

    // One decoded wire envelope.
    struct Frame
    {
        std::uint8_t sender{};
        std::variant<Event, SyncRequest, SyncResponse> body;
    };

    auto ToFbSuit(Suit s) noexcept -> fasttrack::gen::net::Suit;
    auto ToFbRank(Rank r) noexcept -> fasttrack::gen::net::Rank;
    auto ToFbMoveType(MoveType t) noexcept -> fasttrack::gen::net::MoveType;
    auto ToFbPhase(Phase p) noexcept -> fasttrack::gen::net::Phase;

    auto FromFbSuit(fasttrack::gen::net::Suit s) noexcept -> Suit;
    auto FromFbRank(fasttrack::gen::net::Rank r) noexcept -> Rank;
    auto FromFbMoveType(fasttrack::gen::net::MoveType t) noexcept -> MoveType;
    auto FromFbPhase(fasttrack::gen::net::Phase p) noexcept -> Phase;

    // --- Wire envelopes ---

    auto EncodeEvent(Event const& e, std::uint8_t sender) -> std::vector<std::uint8_t>;
    auto EncodeSyncRequest(SyncRequest const& r, std::uint8_t sender) -> std::vector<std::uint8_t>;
    auto EncodeSyncResponse(SyncResponse const& r, std::uint8_t sender) -> std::vector<std::uint8_t>;

    // Verifies the buffer before touching it; malformed input never throws.
    auto DecodeFrame(std::span<std::uint8_t const> bytes) -> std::expected<Frame, ParseError>;

    // --- Full state snapshot ---

    auto EncodeSnapshot(GameState const& s) -> flatbuffers::DetachedBuffer;
    auto DecodeSnapshot(std::span<std::uint8_t const> bytes) -> std::expected<GameState, ParseError>;
    // Also checks every hole id and section against the board.
    auto DecodeSnapshot(std::span<std::uint8_t const> bytes, Board const& board)
        -> std::expected<GameState, ParseError>;

    // FNV-1a 64 over the snapshot bytes. Equal states give equal hashes on every peer.
    auto ComputeStateHash(GameState const& s) -> std::uint64_t;

    // --- Replay log ---

    auto EncodeEventLog(std::span<Event const> events) -> std::vector<std::uint8_t>;
    auto DecodeEventLog(std::span<std::uint8_t const> bytes) -> std::expected<std::vector<Event>, ParseError>;

    // File helpers; I/O failures are Serialization errors, content problems are ParseErrors.
    auto WriteEventLog(std::filesystem::path const& path, std::span<Event const> events) -> void;
    auto ReadEventLog(std::filesystem::path const& path) -> std::expected<std::vector<Event>, ParseError>;
} // namespace fasttrack::core::net

#endif //FASTTRACK_CODEC_HPP
