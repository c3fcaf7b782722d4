//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Atomically replaceable immutable value cell.
///
/// Readers take a shared snapshot without blocking writers; writers publish a
/// whole new value. Used for read-mostly session state such as settings.
///
//===----------------------------------------------------------------------===//
#ifndef WAKATIMELS_SUPPORT_SNAPSHOT_CELL_H
#define WAKATIMELS_SUPPORT_SNAPSHOT_CELL_H

#include <atomic>
#include <memory>
#include <utility>

namespace wakatimels
{

/// @brief Holds an immutable `T` that can be replaced as a whole.
template <typename T>
class SnapshotCell final
{
public:
    /// @brief Shared read-only view of the stored value.
    using Snapshot = std::shared_ptr<const T>;

    SnapshotCell()
        : value_(std::make_shared<const T>())
    {
    }

    explicit SnapshotCell(T initial)
        : value_(std::make_shared<const T>(std::move(initial)))
    {
    }

    SnapshotCell(const SnapshotCell&)            = delete;
    SnapshotCell& operator=(const SnapshotCell&) = delete;

    /// @brief Returns the current value. Never null.
    [[nodiscard]] Snapshot load() const
    {
        return value_.load(std::memory_order_acquire);
    }

    /// @brief Publishes a new value.
    void store(T next)
    {
        value_.store(std::make_shared<const T>(std::move(next)), std::memory_order_release);
    }

private:
    std::atomic<std::shared_ptr<const T>> value_;
};

}  // namespace wakatimels

#endif  // WAKATIMELS_SUPPORT_SNAPSHOT_CELL_H
