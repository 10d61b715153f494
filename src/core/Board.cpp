//
// Created by Malik T on 19/10/2026.
//

#include "Board.hpp"

#include <format>
#include "Exception.hpp"

namespace fasttrack::core
{
    Board::Board(BoardConfig const& cfg) :
        cfg_(cfg)
    {
        FTK_ASSERT(cfg_.sections >= constants::MinPlayers, "Board needs at least two sections");
        FTK_ASSERT(cfg_.lane_holes >= 2, "Board lanes need at least two holes");
        FTK_ASSERT(cfg_.safe_slots >= 1, "Board needs a safe zone");
        FTK_ASSERT(cfg_.holding_slots >= 1, "Board needs a holding area");

        uint16_t const lane = cfg_.lane_holes;
        section_length_ = static_cast<uint16_t>(3 * lane + 2);
        perimeter_size_ = static_cast<uint16_t>(section_length_ * cfg_.sections);
        holes_.reserve(perimeter_size_ + cfg_.sections * (cfg_.safe_slots + cfg_.holding_slots) + 1);
        corners_.resize(cfg_.sections, NoHole);

        // perimeter, clockwise, one section at a time
        for (uint8_t s = 0; s < cfg_.sections; ++s)
        {
            for (uint16_t i = 0; i < lane; ++i)
            {
                AddHole({.kind = HoleKind::Perimeter, .name = std::format("side-left-{}-{}", s, i + 1)});
            }
            for (uint16_t i = 0; i < lane; ++i)
            {
                bool const entry = (i == lane / 2);
                AddHole({
                    .kind = entry ? HoleKind::SafeEntry : HoleKind::Perimeter,
                    .section = entry ? std::optional<uint8_t>{s} : std::nullopt,
                    .name = std::format("outer-{}-{}", s, i)
                });
            }
            AddHole({.kind = HoleKind::Home, .section = s, .name = std::format("home-{}", s)});
            for (uint16_t i = 0; i < lane; ++i)
            {
                AddHole({.kind = HoleKind::Perimeter, .name = std::format("side-right-{}-{}", s, lane - i)});
            }
            auto const ring = static_cast<uint8_t>((s + 1) % cfg_.sections);
            corners_[ring] = AddHole({
                .kind = HoleKind::ShortcutCorner, .ring_index = ring, .name = std::format("ft-{}", ring)
            });
        }
        for (HoleId h = 0; h < perimeter_size_; ++h)
        {
            holes_[h].perimeter_index = h;
        }

        safe_base_ = static_cast<HoleId>(holes_.size());
        for (uint8_t s = 0; s < cfg_.sections; ++s)
        {
            for (uint8_t i = 0; i < cfg_.safe_slots; ++i)
            {
                AddHole({
                    .kind = HoleKind::SafeZone, .section = s, .slot = i,
                    .name = std::format("safe-{}-{}", s, i + 1)
                });
            }
        }

        holding_base_ = static_cast<HoleId>(holes_.size());
        for (uint8_t s = 0; s < cfg_.sections; ++s)
        {
            for (uint8_t i = 0; i < cfg_.holding_slots; ++i)
            {
                AddHole({
                    .kind = HoleKind::Holding, .section = s, .slot = i,
                    .name = std::format("hold-{}-{}", s, i + 1)
                });
            }
        }

        capture_hole_ = AddHole({.kind = HoleKind::CaptureHole, .name = "center"});
    }

    auto Board::AddHole(Hole h) -> HoleId
    {
        auto const id = static_cast<HoleId>(holes_.size());
        h.id = id;
        by_name_.emplace(h.name, id);
        holes_.push_back(std::move(h));
        return id;
    }

    auto Board::At(HoleId h) const -> Hole const&
    {
        if (!Contains(h))
            FTK_THROW(error::Code::State, std::format("Hole id {} outside the board ({} holes)", h, holes_.size()));
        return holes_[h];
    }

    auto Board::Find(std::string_view name) const -> std::optional<HoleId>
    {
        auto const it = by_name_.find(std::string{name});
        if (it == by_name_.end()) return std::nullopt;
        return it->second;
    }

    auto Board::NextPerimeter(HoleId h, Direction d) const -> HoleId
    {
        uint16_t const idx = At(h).perimeter_index;
        FTK_ASSERT(idx != Hole::NoIndex, std::format("{} is not on the perimeter", Name(h)));
        if (d == Direction::Forward)
            return static_cast<HoleId>((idx + 1) % perimeter_size_);
        return static_cast<HoleId>((idx + perimeter_size_ - 1) % perimeter_size_);
    }

    auto Board::NextShortcut(HoleId corner) const -> HoleId
    {
        auto const ring = At(corner).ring_index;
        FTK_ASSERT(ring.has_value(), std::format("{} is not a shortcut corner", Name(corner)));
        return corners_[(*ring + 1) % cfg_.sections];
    }

    auto Board::PrevShortcut(HoleId corner) const -> HoleId
    {
        auto const ring = At(corner).ring_index;
        FTK_ASSERT(ring.has_value(), std::format("{} is not a shortcut corner", Name(corner)));
        return corners_[(*ring + cfg_.sections - 1) % cfg_.sections];
    }

    auto Board::NextSafe(HoleId h) const -> std::optional<HoleId>
    {
        Hole const& hole = At(h);
        if (hole.kind == HoleKind::SafeEntry) return SafeSlot(*hole.section, 0);
        if (hole.kind != HoleKind::SafeZone) return std::nullopt;
        if (hole.slot + 1 >= cfg_.safe_slots) return std::nullopt;
        return static_cast<HoleId>(h + 1);
    }

    auto Board::Next(HoleId h, Direction d, Traversal t) const -> std::optional<HoleId>
    {
        switch (t)
        {
        case Traversal::Perimeter:
            if (!IsPerimeter(h)) return std::nullopt;
            return NextPerimeter(h, d);
        case Traversal::Shortcut:
            if (d != Direction::Forward || !IsCorner(h)) return std::nullopt;
            return NextShortcut(h);
        case Traversal::SafeZone:
            if (d != Direction::Forward) return std::nullopt;
            return NextSafe(h);
        }
        return std::nullopt;
    }

    auto Board::Home(uint8_t section) const -> HoleId
    {
        FTK_ASSERT(section < cfg_.sections, "Section out of range");
        return static_cast<HoleId>(section * section_length_ + 2 * cfg_.lane_holes);
    }

    auto Board::SafeEntry(uint8_t section) const -> HoleId
    {
        FTK_ASSERT(section < cfg_.sections, "Section out of range");
        return static_cast<HoleId>(section * section_length_ + cfg_.lane_holes + cfg_.lane_holes / 2);
    }

    auto Board::SafeSlot(uint8_t section, uint8_t slot) const -> HoleId
    {
        FTK_ASSERT(section < cfg_.sections && slot < cfg_.safe_slots, "Safe slot out of range");
        return static_cast<HoleId>(safe_base_ + section * cfg_.safe_slots + slot);
    }

    auto Board::Holding(uint8_t section, uint8_t slot) const -> HoleId
    {
        FTK_ASSERT(section < cfg_.sections && slot < cfg_.holding_slots, "Holding slot out of range");
        return static_cast<HoleId>(holding_base_ + section * cfg_.holding_slots + slot);
    }

    auto Board::ShortcutCorner(uint8_t ring) const -> HoleId
    {
        FTK_ASSERT(ring < cfg_.sections, "Shortcut ring index out of range");
        return corners_[ring];
    }

    auto Board::IsProtected(HoleId h) const -> bool
    {
        HoleKind const k = At(h).kind;
        return k == HoleKind::SafeZone || k == HoleKind::Holding || k == HoleKind::CaptureHole;
    }

    auto Board::Connected(HoleId from, HoleId to) const -> bool
    {
        if (!Contains(from) || !Contains(to) || from == to) return false;
        Hole const& a = holes_[from];
        Hole const& b = holes_[to];

        if (IsPerimeter(from) && IsPerimeter(to))
        {
            if (NextPerimeter(from, Direction::Forward) == to || NextPerimeter(from, Direction::Backward) == to)
                return true;
        }
        if (a.kind == HoleKind::ShortcutCorner && b.kind == HoleKind::ShortcutCorner)
            return NextShortcut(from) == to;
        if (a.kind == HoleKind::ShortcutCorner && b.kind == HoleKind::CaptureHole) return true;
        if (a.kind == HoleKind::CaptureHole && b.kind == HoleKind::ShortcutCorner) return true;
        if (a.kind == HoleKind::SafeEntry || a.kind == HoleKind::SafeZone)
        {
            if (auto const n = NextSafe(from); n && *n == to) return true;
        }
        if (a.kind == HoleKind::Holding) return to == Home(*a.section);
        return false;
    }

    auto Board::SectionForSeat(std::size_t index, std::size_t players, uint8_t sections) -> uint8_t
    {
        FTK_ASSERT(players > 0 && index < players, "Seat index out of range");
        FTK_ASSERT(players <= sections, "More players than board sections");
        return static_cast<uint8_t>(index * sections / players);
    }
}
