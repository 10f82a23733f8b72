//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/yaml/TrustTracker.hpp
// Purpose: Decides whether constructed strings are marked TrustedAsTemplate.
// Key invariants: Strings are trusted only when the loader is trusted and no `!unsafe` scope is open.
// Ownership/Lifetime: One tracker per loader; UnsafeScope is stack-based RAII, non-copyable, non-movable.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace prov::yaml
{

/// @brief Trust state of one load.
/// @invariant unsafeDepth() equals the number of live UnsafeScope objects.
class TrustTracker
{
  public:
    explicit TrustTracker(bool trustedAsTemplate) : trusted_(trustedAsTemplate) {}

    [[nodiscard]] bool trustedAsTemplate() const
    {
        return trusted_;
    }

    [[nodiscard]] uint32_t unsafeDepth() const
    {
        return depth_;
    }

    /// @brief True while at least one `!unsafe` node is being constructed.
    [[nodiscard]] bool suppressed() const
    {
        return depth_ > 0;
    }

    /// @brief Whether a string constructed now gets TrustedAsTemplate.
    [[nodiscard]] bool shouldTrustStrings() const
    {
        return trusted_ && depth_ == 0;
    }

    /// @brief RAII guard raising the unsafe depth for its lifetime.
    /// @details The depth is restored on every exit path, exceptions included.
    class UnsafeScope
    {
      public:
        explicit UnsafeScope(TrustTracker &tracker) : tracker_(tracker)
        {
            ++tracker_.depth_;
        }

        ~UnsafeScope()
        {
            --tracker_.depth_;
        }

        UnsafeScope(const UnsafeScope &) = delete;
        UnsafeScope &operator=(const UnsafeScope &) = delete;
        UnsafeScope(UnsafeScope &&) = delete;
        UnsafeScope &operator=(UnsafeScope &&) = delete;

      private:
        TrustTracker &tracker_;
    };

  private:
    bool trusted_;
    uint32_t depth_{0};
};

} // namespace prov::yaml
