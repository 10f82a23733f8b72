//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/arena.hpp
// Purpose: Typed object arena handing out stable references.
// Key invariants: References returned by make() stay valid until reset() or destruction.
// Ownership/Lifetime: Arena owns every object it creates; callers hold non-owning pointers.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <deque>
#include <utility>

namespace prov::support
{
/// @brief Append-only pool of @p T objects.
///
/// Objects are placed in a deque so growth never relocates existing entries.
/// Individual objects cannot be freed; invoke reset() to drop all of them.
/// Moving an arena keeps the addresses of its objects.
/// @invariant Objects are not individually freed; use reset() to reuse.
/// @ownership Owns every object it created.
template <class T> class Arena
{
  public:
    Arena() = default;
    Arena(const Arena &) = delete;
    Arena &operator=(const Arena &) = delete;
    Arena(Arena &&) = default;
    Arena &operator=(Arena &&) = default;

    /// @brief Construct a new object in place.
    /// @return Reference valid for the arena's lifetime.
    template <class... Args> T &make(Args &&...args)
    {
        return slots_.emplace_back(std::forward<Args>(args)...);
    }

    /// @brief Number of objects created since the last reset().
    [[nodiscard]] std::size_t size() const
    {
        return slots_.size();
    }

    /// @brief Destroy every object; outstanding pointers dangle afterwards.
    void reset()
    {
        slots_.clear();
    }

  private:
    std::deque<T> slots_;
};
} // namespace prov::support
