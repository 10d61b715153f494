//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_REDUCER_HPP
#define FASTTRACK_REDUCER_HPP

#include <expected>
#include <span>
#include <string>
#include "Types.hpp"
#include "Events.hpp"
#include "State.hpp"
#include "Board.hpp"
#include "Cards.hpp"
#include "MoveGenerator.hpp"
#include "Rules.hpp"
#include "StandardRules.hpp"

namespace fasttrack::core
{
    enum class EffectKind : uint8_t
    {
        PlayerJoined,
        GameStarted,
        CardDrawn,
        DeckReshuffled,
        PieceEntered,
        PieceMoved,
        CaptureResolved,
        ShortcutRevoked,
        ForcedShortcutExit,
        NoLegalMoves,
        ExtraTurn,
        TurnPassed,
        GameWon
    };

    auto ToString(EffectKind k) -> std::string_view;

    // Observable consequence of an event; only the fields relevant to the kind are set.
    struct Effect
    {
        EffectKind kind{};
        std::optional<SeatT> seat{};
        std::optional<PieceId> piece{};
        std::optional<PieceId> other{}; // captured piece
        std::optional<HoleId> hole{};
        std::optional<Card> card{};
    };

    struct ApplyResult
    {
        GameState state;
        std::vector<Effect> effects;
    };

    struct Rejection
    {
        error::Code code{error::Code::InvalidEvent};
        std::string message;
        std::vector<error::RuleViolation> violations;
    };

    using ApplyOutcome = std::expected<ApplyResult, Rejection>;

    // Pure state machine: (state, event) -> (state', effects). The input state is never touched.
    class Reducer
    {
    public:
        explicit Reducer(Config const& config = {},
                         std::unique_ptr<RuleRegistry> rules = MakeStandardRules(),
                         CardTable cards = CardTable::Standard());

        auto Apply(GameState const& s, Event const& e) const -> ApplyOutcome;

        // Validated candidates for the current phase. Split first parts carry Note_SplitPart
        // and must be played with SplitMovePlayed.
        auto LegalMoves(GameState const& s) const -> std::vector<Candidate>;

        // Rule report for a move played with the current card.
        auto Validate(GameState const& s, SeatT seat, Move const& m) const -> ValidationReport;

        // Folds a complete log over the empty state.
        auto Replay(std::span<Event const> log) const -> std::expected<GameState, Rejection>;

        auto CurrentCard(GameState const& s) const -> CardSpec const*;

        auto GetConfig() const noexcept -> Config const& { return cfg_; }
        auto GetBoard() const noexcept -> Board const& { return *board_; }
        auto Cards() const noexcept -> CardTable const& { return cards_; }
        auto Generator() const noexcept -> MoveGenerator const& { return generator_; }

    private:
        auto OnJoined(ApplyResult& r, PlayerJoined const& e) const -> std::expected<void, Rejection>;
        auto OnStarted(ApplyResult& r, GameStarted const& e) const -> std::expected<void, Rejection>;
        auto OnCardDrawn(ApplyResult& r, CardDrawn const& e) const -> std::expected<void, Rejection>;
        auto OnMovePlayed(ApplyResult& r, MovePlayed const& e) const -> std::expected<void, Rejection>;
        auto OnSplitMovePlayed(ApplyResult& r, SplitMovePlayed const& e) const -> std::expected<void, Rejection>;
        auto OnTurnEnded(ApplyResult& r, TurnEnded const& e) const -> std::expected<void, Rejection>;

        // Finds the generated candidate matching the played route and runs every rule on it.
        auto Resolve(GameState const& s, SeatT seat, Move const& m, std::optional<PieceId> exclude) const
            -> std::expected<Candidate, Rejection>;
        auto IsLegal(GameState const& s, SeatT seat, Candidate const& c) const -> bool;
        auto SplitFirstParts(GameState const& s, SeatT seat, CardSpec const& card) const -> std::vector<Candidate>;
        auto HasSplitCompletion(GameState const& s, SeatT seat, Candidate const& first, uint8_t remaining) const -> bool;

        auto MovePiece(GameState& s, SeatT seat, Candidate const& c, std::vector<Effect>& effects) const -> void;
        auto FinishMove(ApplyResult& r, Candidate const& c) const -> void;
        auto ResolveTurn(ApplyResult& r, bool allow_extra) const -> void;
        auto ForceShortcutExits(ApplyResult& r) const -> void;
        auto Draw(GameState& s, std::vector<Effect>& effects) const -> Card;

    private:
        Config cfg_;
        std::shared_ptr<Board const> board_;
        CardTable cards_;
        std::unique_ptr<RuleRegistry> rules_;
        MoveGenerator generator_;
    };
}
#endif //FASTTRACK_REDUCER_HPP
