#pragma once

#include <type_traits>

namespace sandtest {

/**
 * \brief A trivially-movable, but non-copyable type.
 *
 * Use as a superclass to annotate a subclass as non-copyable.
 */
class NonCopyable
{
public:
    NonCopyable() = default;

    NonCopyable& operator=(const NonCopyable&) = delete;
    NonCopyable(const NonCopyable&) = delete;

    NonCopyable(NonCopyable&&) = default;
    NonCopyable& operator=(NonCopyable&&) = default;

    ~NonCopyable() = default;
};

static_assert(std::is_trivially_constructible_v<NonCopyable> && !std::is_copy_assignable_v<NonCopyable> &&
                  !std::is_copy_constructible_v<NonCopyable> && std::is_trivially_move_assignable_v<NonCopyable> &&
                  std::is_trivially_move_constructible_v<NonCopyable>,
              "Class NonCopyable should be trivially constructible and movable, not copyable");

/**
 * \brief A non-movable and non-copyable type.
 *
 * Use as a superclass for process-wide singletons and RAII helpers that must stay put.
 */
class NonMovable : public NonCopyable
{
public:
    NonMovable() = default;

    NonMovable(const NonMovable&) = delete;
    NonMovable& operator=(const NonMovable&) = delete;

    NonMovable(NonMovable&&) = delete;
    NonMovable& operator=(NonMovable&&) = delete;

    ~NonMovable() = default;
};

static_assert(!std::is_copy_assignable_v<NonMovable> && !std::is_copy_constructible_v<NonMovable> &&
                  !std::is_move_assignable_v<NonMovable> && !std::is_move_constructible_v<NonMovable>,
              "Class NonMovable should be neither copyable nor movable");

} // namespace sandtest
