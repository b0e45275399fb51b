#pragma once

/// @addtogroup service
/// @{

namespace Service
{

/**
 * The session (e.g: a client connection) that services are bound to.
 *
 * Services don't use anything about their node except whether they still have one, so this is just a base class for
 * whatever the session actually is.
 */
class Node
{
public:
    virtual ~Node();
};

} // namespace Service

/// @}
