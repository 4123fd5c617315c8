#include "events/IEventPublisher.hpp"

namespace monolith::events {

Context withEventPublisher(const Context& ctx, IEventPublisher* publisher) {
    Context child = ctx;
    child.publisher_ = publisher;
    return child;
}

IEventPublisher* publisherFromContext(const Context& ctx) {
    return ctx.publisher_;
}

} // namespace monolith::events
