#include "direction.h"

const std::array<Direction, DirectionCount> AllDirections = {
    Direction::Up,
    Direction::Down,
    Direction::Right,
    Direction::Left,
    Direction::UpLeft,
    Direction::DownLeft,
    Direction::UpRight,
    Direction::DownRight,
    Direction::RightRightUp,
    Direction::RightUpUp,
    Direction::RightRightDown,
    Direction::RightDownDown,
    Direction::LeftUpUp,
    Direction::LeftLeftUp,
    Direction::LeftLeftDown,
    Direction::LeftDownDown};

Step step_of(Direction direction) noexcept
{
    switch (direction)
    {
    case Direction::Up:             return {0, -1};
    case Direction::Down:           return {0, 1};
    case Direction::Right:          return {1, 0};
    case Direction::Left:           return {-1, 0};
    case Direction::UpLeft:         return {-1, -1};
    case Direction::DownLeft:       return {-1, 1};
    case Direction::UpRight:        return {1, -1};
    case Direction::DownRight:      return {1, 1};
    case Direction::RightRightUp:   return {2, -1};
    case Direction::RightUpUp:      return {1, -2};
    case Direction::RightRightDown: return {2, 1};
    case Direction::RightDownDown:  return {1, 2};
    case Direction::LeftUpUp:       return {-1, -2};
    case Direction::LeftLeftUp:     return {-2, -1};
    case Direction::LeftLeftDown:   return {-2, 1};
    case Direction::LeftDownDown:   return {-1, 2};
    }
    return {0, 0};
}

Direction opposite(Direction direction) noexcept
{
    switch (direction)
    {
    case Direction::Up:             return Direction::Down;
    case Direction::Down:           return Direction::Up;
    case Direction::Right:          return Direction::Left;
    case Direction::Left:           return Direction::Right;
    case Direction::UpLeft:         return Direction::DownRight;
    case Direction::DownLeft:       return Direction::UpRight;
    case Direction::UpRight:        return Direction::DownLeft;
    case Direction::DownRight:      return Direction::UpLeft;
    case Direction::RightRightUp:   return Direction::LeftLeftDown;
    case Direction::RightUpUp:      return Direction::LeftDownDown;
    case Direction::RightRightDown: return Direction::LeftLeftUp;
    case Direction::RightDownDown:  return Direction::LeftUpUp;
    case Direction::LeftUpUp:       return Direction::RightDownDown;
    case Direction::LeftLeftUp:     return Direction::RightRightDown;
    case Direction::LeftLeftDown:   return Direction::RightRightUp;
    case Direction::LeftDownDown:   return Direction::RightUpUp;
    }
    return direction;
}

bool is_orthogonal(Direction direction) noexcept
{
    const Step step = step_of(direction);
    return (step.dx == 0) != (step.dy == 0);
}

bool is_diagonal(Direction direction) noexcept
{
    const Step step = step_of(direction);
    return step.dx != 0 && (step.dx == step.dy || step.dx == -step.dy);
}

bool is_knight_jump(Direction direction) noexcept
{
    return !is_orthogonal(direction) && !is_diagonal(direction);
}

std::size_t DirectionSet::size() const noexcept
{
    std::size_t count = 0;
    for (Direction direction : AllDirections)
    {
        if (contains(direction))
        {
            ++count;
        }
    }
    return count;
}
