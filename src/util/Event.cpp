#include "Event.hpp"

EventAlreadyResolved::~EventAlreadyResolved() = default;
EventAlreadyResolved::EventAlreadyResolved() : std::logic_error("Event is already resolved.") {}

EventNotResolved::~EventNotResolved() = default;
EventNotResolved::EventNotResolved() : std::logic_error("Event is not resolved.") {}
