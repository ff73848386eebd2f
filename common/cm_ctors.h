#pragma once

#include <type_traits>

// Helper macros to declare/delete copy-moves inside class definition.
// TEST_MOVE_NOEX must be used OUTSIDE class definition like
/*
    class A{};
    TEST_MOVE_NOEX(A);
*/

// NOLINTNEXTLINE
#define TEST_MOVE_NOEX(TYPE)                                                                       \
    static_assert(std::is_nothrow_move_constructible_v<TYPE>                                       \
                    && std::is_nothrow_move_assignable_v<TYPE>,                                    \
                  " Should be noexcept Moves.")

// NOLINTNEXTLINE
#define NO_COPYMOVE(TYPE)                                                                          \
    TYPE(const TYPE &) = delete;                                                                   \
    TYPE(TYPE &&) = delete;                                                                        \
    TYPE &operator=(const TYPE &) = delete;                                                        \
    TYPE &operator=(TYPE &&) = delete

// NOLINTNEXTLINE
#define DEFAULT_COPYMOVE(TYPE)                                                                     \
    TYPE(const TYPE &) = default;                                                                  \
    TYPE(TYPE &&) = default;                                                                       \
    TYPE &operator=(const TYPE &) = default;                                                       \
    TYPE &operator=(TYPE &&) = default // NOLINT
