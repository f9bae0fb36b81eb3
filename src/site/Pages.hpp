#pragma once
#include <memory>

#include "http/Router.hpp"

namespace onionsite {

class SharedAddressCell;

// Routes for the loopback listener that the onion service forwards to.
std::shared_ptr<const Router> make_onion_router();

// Routes for the public listener. Pages read the onion address from the
// cell on every request; until discovery publishes it they say so.
std::shared_ptr<const Router> make_public_router(std::shared_ptr<const SharedAddressCell> address);

} // namespace onionsite
