#include <exception>

#include "deepsize/context.hpp"
#include "deepsize/log/logger.hpp"


namespace deepsize {

Context::Context()
    : Context(Config{})
{}

Context::Context(const Config& cfg)
    : config_(cfg)
{
    visited_.reserve(config::visited_reserve);
}

bool Context::try_mark(const identity& id) {
    const bool inserted = visited_.insert(id).second;
    if (!inserted) {
        DS_TRACE("[deepsize] allocation 0x" << std::hex << id.address << std::dec
                 << " already counted, skipping");
    }
    return inserted;
}

bool Context::contains(const identity& id) const {
    return visited_.find(id) != visited_.end();
}

bool Context::enter() noexcept {
    if (depth_ >= config_.max_depth) {
        if (truncated_++ == 0 && config_.warn_on_truncation) {
            try {
                DS_WARN("[deepsize] traversal depth limit (" << config_.max_depth
                        << ") reached, result will be under-counted");
            } catch (const std::exception&) {
                // enter() is noexcept: a throwing sink drops the message
            }
        }
        return false;
    }
    ++depth_;
    return true;
}

void Context::leave() noexcept {
    if (depth_ > 0) --depth_;
}

void Context::reset() {
    visited_.clear();
    depth_ = 0;
    truncated_ = 0;
}

} // namespace deepsize
