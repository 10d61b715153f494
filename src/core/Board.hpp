//
// Created by Malik T on 19/10/2026.
//

#ifndef FASTTRACK_BOARD_HPP
#define FASTTRACK_BOARD_HPP

#include <string_view>
#include <unordered_map>
#include "Types.hpp"

namespace fasttrack::core
{
    struct Hole
    {
        static constexpr uint16_t NoIndex = std::numeric_limits<uint16_t>::max();

        HoleId id{NoHole};
        HoleKind kind{HoleKind::Perimeter};
        std::optional<uint8_t> section{}; // owner section for home, entry, safe zone and holding
        uint16_t perimeter_index{NoIndex};
        std::optional<uint8_t> ring_index{}; // position on the shortcut ring
        uint8_t slot{};                      // safe-zone / holding slot
        std::string name;
    };

    // Immutable hole graph. Perimeter holes have id == perimeter index so that
    // every neighbour query is O(1) arithmetic or a table lookup.
    class Board
    {
    public:
        explicit Board(BoardConfig const& cfg);

        auto Config() const noexcept -> BoardConfig const& { return cfg_; }
        auto Size() const noexcept -> std::size_t { return holes_.size(); }
        auto PerimeterSize() const noexcept -> uint16_t { return perimeter_size_; }
        auto SectionLength() const noexcept -> uint16_t { return section_length_; }
        auto Sections() const noexcept -> uint8_t { return cfg_.sections; }

        auto Contains(HoleId h) const noexcept -> bool { return h < holes_.size(); }
        auto At(HoleId h) const -> Hole const&;
        auto Name(HoleId h) const -> std::string const& { return At(h).name; }
        auto Find(std::string_view name) const -> std::optional<HoleId>;

        // Next hole under the given traversal mode; nullopt when the mode has no successor there.
        auto Next(HoleId h, Direction d, Traversal t) const -> std::optional<HoleId>;
        auto NextPerimeter(HoleId h, Direction d) const -> HoleId;
        auto NextShortcut(HoleId corner) const -> HoleId;
        auto PrevShortcut(HoleId corner) const -> HoleId;
        auto NextSafe(HoleId h) const -> std::optional<HoleId>;

        auto Home(uint8_t section) const -> HoleId;
        auto SafeEntry(uint8_t section) const -> HoleId;
        auto SafeSlot(uint8_t section, uint8_t slot) const -> HoleId;
        auto Holding(uint8_t section, uint8_t slot) const -> HoleId;
        auto ShortcutCorner(uint8_t ring) const -> HoleId;
        auto ShortcutExit(uint8_t section) const -> HoleId { return ShortcutCorner(section); }
        auto CaptureHole() const noexcept -> HoleId { return capture_hole_; }

        auto IsPerimeter(HoleId h) const -> bool { return At(h).perimeter_index != Hole::NoIndex; }
        auto IsCorner(HoleId h) const -> bool { return At(h).kind == HoleKind::ShortcutCorner; }
        auto IsSafe(HoleId h) const -> bool { return At(h).kind == HoleKind::SafeZone; }
        auto IsHolding(HoleId h) const -> bool { return At(h).kind == HoleKind::Holding; }
        // Holes where nothing can be captured.
        auto IsProtected(HoleId h) const -> bool;

        // True when a single hop from `from` to `to` exists under any traversal mode.
        auto Connected(HoleId from, HoleId to) const -> bool;

        // Spreads `players` seats evenly over the board sections.
        static auto SectionForSeat(std::size_t index, std::size_t players, uint8_t sections) -> uint8_t;

    private:
        auto AddHole(Hole h) -> HoleId;

    private:
        BoardConfig cfg_;
        uint16_t section_length_{};
        uint16_t perimeter_size_{};
        HoleId safe_base_{};
        HoleId holding_base_{};
        HoleId capture_hole_{NoHole};
        std::vector<Hole> holes_;
        std::vector<HoleId> corners_; // by ring index
        std::unordered_map<std::string, HoleId> by_name_;
    };
}

#endif //FASTTRACK_BOARD_HPP
