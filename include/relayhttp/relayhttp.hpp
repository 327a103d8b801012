#ifndef RELAY_HTTP_HPP
#define RELAY_HTTP_HPP

#include "relayhttp/Errors.hpp"
#include "relayhttp/Headers.hpp"
#include "relayhttp/HeaderValues.hpp"
#include "relayhttp/Uri.hpp"
#include "relayhttp/Request.hpp"
#include "relayhttp/Response.hpp"
#include "relayhttp/Transport.hpp"
#include "relayhttp/ConnectionPool.hpp"
#include "relayhttp/Middleware.hpp"
#include "relayhttp/Auth.hpp"
#include "relayhttp/Cookies.hpp"
#include "relayhttp/Decompress.hpp"
#include "relayhttp/Client.hpp"

#endif // RELAY_HTTP_HPP
