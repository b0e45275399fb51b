#include "Node.hpp"

Service::Node::~Node() = default;
