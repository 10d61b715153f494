//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_SYNCSESSION_HPP
#define FASTTRACK_SYNCSESSION_HPP

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "../core/Events.hpp"
#include "../core/Reducer.hpp"
#include "../core/State.hpp"
#include "../debug/AuditLogger.hpp"
#include "codec.hpp"

namespace fasttrack::net
{
    // Outbound side of a peer. Delivery is broadcast; ordering is restored by the receiver.
    class EventSink
    {
    public:
        virtual ~EventSink() = default;
        virtual auto Deliver(std::uint8_t from, std::vector<std::uint8_t> bytes) -> void = 0;
    };

    // Why a session stopped accepting events. `code` is SyncDiverged for hash mismatches and
    // for remote events the local reducer refuses, Serialization for frames that did not decode,
    // InvalidEvent for frames that name a sequence too far ahead. Only SyncDiverged freezes.
    struct SyncFault
    {
        core::error::Code code{core::error::Code::SyncDiverged};
        std::uint64_t sequence{};
        std::optional<std::uint64_t> local_hash{};
        std::optional<std::uint64_t> remote_hash{};
        std::uint8_t peer{};
        std::string reason;
    };

    auto Describe(SyncFault const& f) -> std::string;

    struct ReceiveReport
    {
        std::size_t applied{};   // events applied by this call, buffered ones included
        bool buffered{false};    // event arrived ahead of sequence
        bool duplicate{false};
        bool answered{false};    // a sync request was answered
        bool deferred{false};    // hash check waits for a sequence not reached yet
    };

    // One peer's view of the game: an independent reducer fed by the ordered event log.
    // Frozen after a fault until ResyncFrom replaces the log; state is never patched in place.
    class SyncSession
    {
    public:
        // How far past the next expected sequence events and checks are still buffered.
        static constexpr std::uint64_t PendingWindow = 512;

        SyncSession(std::uint8_t self, core::Reducer const& reducer, EventSink& sink,
                    std::size_t checkpoint_interval = 16, core::debug::AuditLogger* log = nullptr);

        // Stamps the next sequence number, applies, records the hash and broadcasts.
        auto SubmitLocal(core::EventPayload payload) -> std::expected<core::ApplyResult, core::Rejection>;

        // Handles one inbound frame: events, sync requests and sync responses.
        auto Receive(std::span<std::uint8_t const> bytes) -> std::expected<ReceiveReport, SyncFault>;

        // Rebuilds state, log and hashes from an authoritative log and lifts the freeze.
        auto ResyncFrom(std::span<core::Event const> log) -> std::expected<void, core::Rejection>;

        auto State() const noexcept -> core::GameState const& { return state_; }
        auto Log() const noexcept -> std::vector<core::Event> const& { return log_; }
        auto HashAt(std::uint64_t sequence) const -> std::optional<std::uint64_t>;
        auto CurrentHash() const -> std::uint64_t;
        auto Frozen() const noexcept -> bool { return fault_.has_value(); }
        auto Fault() const noexcept -> std::optional<SyncFault> const& { return fault_; }
        auto PendingCount() const noexcept -> std::size_t { return pending_.size(); }
        auto Self() const noexcept -> std::uint8_t { return self_; }

    private:
        struct PendingEvent
        {
            core::Event event;
            std::uint8_t from{};
        };

        struct PendingCheck
        {
            std::uint64_t hash{};
            std::uint8_t peer{};
            bool request{false};
        };

        auto Commit(core::Event const& e, core::ApplyResult const& r) -> std::expected<void, SyncFault>;
        auto ApplyRemote(core::Event const& e, std::uint8_t from) -> std::expected<void, SyncFault>;
        auto Checkpoint(std::uint64_t sequence) -> void;
        auto DrainPending(ReceiveReport& report) -> std::expected<void, SyncFault>;
        auto TooFarAhead(std::uint64_t sequence, std::uint64_t next, std::uint8_t from) const -> std::unexpected<SyncFault>;
        auto Check(std::uint64_t sequence, PendingCheck const& c) -> std::expected<void, SyncFault>;
        auto Freeze(SyncFault f) -> std::unexpected<SyncFault>;

    private:
        std::uint8_t self_;
        core::Reducer const& reducer_;
        EventSink& sink_;
        std::size_t checkpoint_interval_;
        core::debug::AuditLogger* log_file_;

        core::GameState state_{};
        std::vector<core::Event> log_;
        std::vector<std::uint64_t> hashes_; // hashes_[seq]: state after event seq
        std::map<std::uint64_t, PendingEvent> pending_;
        std::multimap<std::uint64_t, PendingCheck> checks_;
        std::optional<SyncFault> fault_{};
    };
}

#endif //FASTTRACK_SYNCSESSION_HPP
