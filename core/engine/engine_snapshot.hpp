#pragma once

#include <any>
#include <type_traits>
#include <utility>

namespace tale {

// ─── Engine Snapshot ───────────────────────────────────────────
// Opaque engine state captured by getState() and handed back to
// setState() verbatim. The session stores and copies it but never
// looks inside; only the engine that produced it knows the payload type.

class EngineSnapshot {
public:
    EngineSnapshot() = default;
    template <typename T,
              std::enable_if_t<!std::is_same_v<std::decay_t<T>, EngineSnapshot>, int> = 0>
    explicit EngineSnapshot(T&& payload)
        : payload_(std::forward<T>(payload)) {}

    bool empty() const { return !payload_.has_value(); }

    const std::any& payload() const { return payload_; }

    /// Typed access for the engine that created the snapshot.
    /// Throws std::bad_any_cast on a foreign snapshot.
    template <typename T>
    const T& as() const { return std::any_cast<const T&>(payload_); }

private:
    std::any payload_;
};

} // namespace tale
