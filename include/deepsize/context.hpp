#pragma once

#include <cstddef>
#include <unordered_set>

#include "deepsize/config.hpp"
#include "deepsize/identity.hpp"

namespace deepsize {

/*
===============================================================================
deepsize::Context
===============================================================================

Mutable state of exactly one traversal.

A Context is created by a top-level deep_size_of() call (or by a caller that
sizes several roots as one aggregate) and passed by reference through every
deep_size_of_children() call below it. It is never shared between threads and
never outlives the traversal: reusing it for an unrelated value would treat
allocations that were counted before as already paid for.

It holds:
  • the visited set: allocation identities already counted
  • the depth guard: how many owning indirections deep we currently are

try_mark() is the only primitive that prevents double counting and breaks
cycles through shared ownership. The depth guard only stops cycles that do
not pass through a marked allocation, or pathological nesting.
===============================================================================
*/

class Context {
public:
    Context();
    explicit Context(const Config& cfg);

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    // Records the identity; true on first sight, false on every later call
    [[nodiscard]] bool try_mark(const identity& id);

    template <typename T>
    [[nodiscard]] inline bool try_mark(const T* p) {
        return try_mark(identity::of(p));
    }

    [[nodiscard]] bool contains(const identity& id) const;

    // Depth guard. enter() refuses once max_depth is reached; every accepted
    // enter() must be paired with leave(). Prefer Context::descent.
    [[nodiscard]] bool enter() noexcept;
    void leave() noexcept;

    // -------------------------------------------------------------------------
    // Scoped descent into owned storage
    // -------------------------------------------------------------------------
    class descent {
    public:
        explicit descent(Context& ctx) noexcept
            : ctx_(ctx), allowed_(ctx.enter()) {}

        ~descent() {
            if (allowed_) ctx_.leave();
        }

        descent(const descent&) = delete;
        descent& operator=(const descent&) = delete;

        [[nodiscard]] explicit operator bool() const noexcept { return allowed_; }

    private:
        Context& ctx_;
        bool allowed_;
    };

    [[nodiscard]] inline std::size_t depth() const noexcept { return depth_; }
    [[nodiscard]] inline std::size_t max_depth() const noexcept { return config_.max_depth; }
    [[nodiscard]] inline std::size_t visited() const noexcept { return visited_.size(); }

    // Number of descents refused by the depth guard
    [[nodiscard]] inline std::size_t truncated() const noexcept { return truncated_; }

    [[nodiscard]] inline const Config& config() const noexcept { return config_; }

    // Forget everything, so the context can size a new, unrelated aggregate
    void reset();

private:
    Config config_;
    std::unordered_set<identity, identity_hash> visited_;
    std::size_t depth_{0};
    std::size_t truncated_{0};
};

} // namespace deepsize
