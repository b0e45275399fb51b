#include "configuration/configuration.hpp"

/* These are used repeatedly in the tests, so don't keep code-generating them repeatedly. */
bool Config::Log::operator==(const Log &) const = default;
bool Config::Service::operator==(const Service &) const = default;
bool Config::GroupLimit::operator==(const GroupLimit &) const = default;
bool Config::TaskPool::operator==(const TaskPool &) const = default;
bool Config::Root::operator==(const Root &) const = default;
