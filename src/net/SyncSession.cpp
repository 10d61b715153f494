//
// Created by Malik T on 19/10/2026.
//

#include "SyncSession.hpp"

#include <format>
#include <print>
#include <utility>

namespace fasttrack::net
{
    using namespace fasttrack::core;

    auto Describe(SyncFault const& f) -> std::string
    {
        std::string s = std::format("[{}] seq={} peer=P{} {}", error::to_string(f.code), f.sequence,
                                    static_cast<int>(f.peer), f.reason);
        if (f.local_hash) s += std::format(" local={:016x}", *f.local_hash);
        if (f.remote_hash) s += std::format(" remote={:016x}", *f.remote_hash);
        return s;
    }

    SyncSession::SyncSession(std::uint8_t self, Reducer const& reducer, EventSink& sink,
                             std::size_t checkpoint_interval, debug::AuditLogger* log) :
        self_(self),
        reducer_(reducer),
        sink_(sink),
        checkpoint_interval_(checkpoint_interval),
        log_file_(log)
    {
    }

    auto SyncSession::HashAt(std::uint64_t sequence) const -> std::optional<std::uint64_t>
    {
        if (sequence >= hashes_.size()) return std::nullopt;
        return hashes_[sequence];
    }

    auto SyncSession::CurrentHash() const -> std::uint64_t
    {
        return core::net::ComputeStateHash(state_);
    }

    auto SyncSession::Freeze(SyncFault f) -> std::unexpected<SyncFault>
    {
        std::string const what = Describe(f);
        std::print(stderr, "[sync P{}] frozen: {}\n", static_cast<int>(self_), what);
        if (log_file_) log_file_->fault(what);
        fault_ = f;
        return std::unexpected(std::move(f));
    }

    auto SyncSession::SubmitLocal(EventPayload payload) -> std::expected<ApplyResult, Rejection>
    {
        if (fault_)
            return std::unexpected(Rejection{
                .code = error::Code::SyncDiverged, .message = std::format("session frozen: {}", Describe(*fault_))
            });

        Event const e{.sequence = state_.next_sequence, .payload = std::move(payload)};
        auto r = reducer_.Apply(state_, e);
        if (!r)
        {
            if (log_file_) log_file_->rejection(e, r.error());
            return std::unexpected(r.error());
        }

        if (auto ok = Commit(e, *r); !ok)
            return std::unexpected(Rejection{.code = error::Code::SyncDiverged, .message = Describe(ok.error())});
        sink_.Deliver(self_, core::net::EncodeEvent(e, self_));
        Checkpoint(e.sequence);
        return r;
    }

    auto SyncSession::Commit(Event const& e, ApplyResult const& r) -> std::expected<void, SyncFault>
    {
        state_ = r.state;
        log_.push_back(e);
        hashes_.push_back(core::net::ComputeStateHash(state_));
        if (log_file_)
        {
            log_file_->event(e, hashes_.back());
            log_file_->effects(r.effects);
        }

        auto [first, last] = checks_.equal_range(e.sequence);
        std::vector<PendingCheck> due;
        for (auto it = first; it != last; ++it) due.push_back(it->second);
        checks_.erase(first, last);
        for (PendingCheck const& c : due)
        {
            if (auto ok = Check(e.sequence, c); !ok) return ok;
        }
        return {};
    }

    auto SyncSession::Checkpoint(std::uint64_t sequence) -> void
    {
        if (checkpoint_interval_ != 0 && (sequence + 1) % checkpoint_interval_ == 0)
        {
            sink_.Deliver(self_, core::net::EncodeSyncRequest({.sequence = sequence, .hash = hashes_.at(sequence)}, self_));
        }
    }

    auto SyncSession::TooFarAhead(std::uint64_t sequence, std::uint64_t next, std::uint8_t from) const
        -> std::unexpected<SyncFault>
    {
        std::print(stderr, "[sync P{}] dropped seq {} from P{}: more than {} ahead of {}\n", static_cast<int>(self_),
                   sequence, static_cast<int>(from), PendingWindow, next);
        return std::unexpected(SyncFault{
            .code = error::Code::InvalidEvent,
            .sequence = sequence,
            .peer = from,
            .reason = std::format("sequence more than {} ahead of {}", PendingWindow, next)
        });
    }

    auto SyncSession::Check(std::uint64_t sequence, PendingCheck const& c) -> std::expected<void, SyncFault>
    {
        std::uint64_t const local = hashes_.at(sequence);
        if (c.request)
        {
            sink_.Deliver(self_, core::net::EncodeSyncResponse({.sequence = sequence, .hash = local}, self_));
        }
        if (local != c.hash)
        {
            return Freeze(SyncFault{
                .code = error::Code::SyncDiverged,
                .sequence = sequence,
                .local_hash = local,
                .remote_hash = c.hash,
                .peer = c.peer,
                .reason = "state hash mismatch"
            });
        }
        return {};
    }

    auto SyncSession::ApplyRemote(Event const& e, std::uint8_t from) -> std::expected<void, SyncFault>
    {
        auto r = reducer_.Apply(state_, e);
        if (!r)
        {
            if (log_file_) log_file_->rejection(e, r.error());
            return Freeze(SyncFault{
                .code = error::Code::SyncDiverged,
                .sequence = e.sequence,
                .local_hash = hashes_.empty() ? std::nullopt : std::optional{hashes_.back()},
                .peer = from,
                .reason = std::format("remote event rejected: {}", r.error().message)
            });
        }
        if (auto ok = Commit(e, *r); !ok) return ok;
        Checkpoint(e.sequence);
        return {};
    }

    auto SyncSession::DrainPending(ReceiveReport& report) -> std::expected<void, SyncFault>
    {
        for (auto it = pending_.find(state_.next_sequence); it != pending_.end();
             it = pending_.find(state_.next_sequence))
        {
            PendingEvent const p = std::move(it->second);
            pending_.erase(it);
            if (auto ok = ApplyRemote(p.event, p.from); !ok) return ok;
            ++report.applied;
        }
        return {};
    }

    auto SyncSession::Receive(std::span<std::uint8_t const> bytes) -> std::expected<ReceiveReport, SyncFault>
    {
        if (fault_) return std::unexpected(*fault_);

        auto frame = core::net::DecodeFrame(bytes);
        if (!frame)
        {
            // undecodable frames are dropped; the session stays live
            std::print(stderr, "[sync P{}] dropped frame: {}\n", static_cast<int>(self_), frame.error().message);
            return std::unexpected(SyncFault{
                .code = error::Code::Serialization,
                .sequence = state_.next_sequence,
                .reason = frame.error().message
            });
        }

        std::uint8_t const from = frame->sender;
        ReceiveReport report{};

        auto const handled = std::visit([&]<typename T0>(T0 const& body) -> std::expected<void, SyncFault>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, Event>)
            {
                if (body.sequence < log_.size())
                {
                    report.duplicate = true;
                    if (core::net::EncodeEvent(body, 0) != core::net::EncodeEvent(log_[body.sequence], 0))
                    {
                        return Freeze(SyncFault{
                            .code = error::Code::SyncDiverged,
                            .sequence = body.sequence,
                            .peer = from,
                            .reason = "conflicting event for an applied sequence"
                        });
                    }
                    return {};
                }
                if (body.sequence > state_.next_sequence)
                {
                    if (body.sequence - state_.next_sequence > PendingWindow)
                        return TooFarAhead(body.sequence, state_.next_sequence, from);
                    auto const [it, fresh] = pending_.try_emplace(body.sequence, PendingEvent{.event = body, .from = from});
                    if (!fresh)
                    {
                        report.duplicate = true;
                        if (core::net::EncodeEvent(body, 0) != core::net::EncodeEvent(it->second.event, 0))
                        {
                            return Freeze(SyncFault{
                                .code = error::Code::SyncDiverged,
                                .sequence = body.sequence,
                                .peer = from,
                                .reason = std::format("conflicting event for a buffered sequence (first from P{})",
                                                      static_cast<int>(it->second.from))
                            });
                        }
                        return {};
                    }
                    report.buffered = true;
                    return {};
                }
                if (auto ok = ApplyRemote(body, from); !ok) return ok;
                ++report.applied;
                return DrainPending(report);
            }
            else
            {
                constexpr bool request = std::is_same_v<T, core::net::SyncRequest>;
                PendingCheck const c{.hash = body.hash, .peer = from, .request = request};
                if (body.sequence >= hashes_.size())
                {
                    if (body.sequence - hashes_.size() >= PendingWindow || checks_.size() >= PendingWindow)
                        return TooFarAhead(body.sequence, hashes_.size(), from);
                    checks_.emplace(body.sequence, c);
                    report.deferred = true;
                    return {};
                }
                report.answered = request;
                return Check(body.sequence, c);
            }
        }, frame->body);

        if (!handled) return std::unexpected(handled.error());
        return report;
    }

    auto SyncSession::ResyncFrom(std::span<Event const> log) -> std::expected<void, Rejection>
    {
        GameState s{};
        std::vector<std::uint64_t> hashes;
        hashes.reserve(log.size());
        for (Event const& e : log)
        {
            auto r = reducer_.Apply(s, e);
            if (!r) return std::unexpected(r.error());
            s = std::move(r->state);
            hashes.push_back(core::net::ComputeStateHash(s));
        }

        std::size_t diverged_at = 0;
        while (diverged_at < hashes.size() && diverged_at < hashes_.size() && hashes[diverged_at] == hashes_[diverged_at])
            ++diverged_at;

        if (log_file_)
        {
            log_file_->correction(std::format("resync: {} events, local history replaced from sequence {}",
                                              log.size(), diverged_at));
        }

        state_ = std::move(s);
        log_.assign(log.begin(), log.end());
        hashes_ = std::move(hashes);
        pending_.clear();
        checks_.clear();
        fault_.reset();
        return {};
    }
}
