#include "events/EventType.hpp"
#include "events/EventExceptions.hpp"
#include <regex>

namespace monolith::events {

EventType::EventType(std::string value)
    : value_(std::move(value))
{
    if (!isValid(value_)) {
        throw InvalidEventTypeException(value_);
    }
}

bool EventType::isValid(const std::string& value) {
    static const std::regex pattern(R"(^[a-z]+\.[A-Z][a-zA-Z]+$)");
    return std::regex_match(value, pattern);
}

std::string EventType::module() const {
    return value_.substr(0, value_.find('.'));
}

std::string EventType::name() const {
    return value_.substr(value_.find('.') + 1);
}

} // namespace monolith::events
