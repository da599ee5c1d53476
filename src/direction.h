#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>

// Step vectors use board rows: y grows from rank 8 (row 0) towards rank 1 (row 7).
enum class Direction : std::uint8_t
{
    Up,
    Down,
    Right,
    Left,
    UpLeft,
    DownLeft,
    UpRight,
    DownRight,
    RightRightUp,
    RightUpUp,
    RightRightDown,
    RightDownDown,
    LeftUpUp,
    LeftLeftUp,
    LeftLeftDown,
    LeftDownDown
};

constexpr std::size_t DirectionCount = 16;

struct Step
{
    int dx{0};
    int dy{0};
};

extern const std::array<Direction, DirectionCount> AllDirections;

Step step_of(Direction direction) noexcept;
Direction opposite(Direction direction) noexcept;
bool is_orthogonal(Direction direction) noexcept;
bool is_diagonal(Direction direction) noexcept;
bool is_knight_jump(Direction direction) noexcept;

class DirectionSet
{
public:
    constexpr DirectionSet() noexcept = default;

    constexpr DirectionSet(std::initializer_list<Direction> directions) noexcept
    {
        for (Direction direction : directions)
        {
            insert(direction);
        }
    }

    constexpr void insert(Direction direction) noexcept
    {
        bits_ = static_cast<std::uint16_t>(bits_ | bit(direction));
    }

    [[nodiscard]] bool contains(Direction direction) const noexcept
    {
        return (bits_ & bit(direction)) != 0;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return bits_ == 0;
    }

    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] DirectionSet intersect(DirectionSet other) const noexcept
    {
        DirectionSet result;
        result.bits_ = static_cast<std::uint16_t>(bits_ & other.bits_);
        return result;
    }

    bool operator==(const DirectionSet& other) const noexcept
    {
        return bits_ == other.bits_;
    }

    bool operator!=(const DirectionSet& other) const noexcept
    {
        return bits_ != other.bits_;
    }

private:
    static constexpr std::uint16_t bit(Direction direction) noexcept
    {
        return static_cast<std::uint16_t>(1U << static_cast<unsigned>(direction));
    }

    std::uint16_t bits_{0};
};
