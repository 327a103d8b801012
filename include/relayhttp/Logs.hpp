#ifndef RELAY_HTTP_LOGS_HPP
#define RELAY_HTTP_LOGS_HPP

#include "relayhttp/Timestamp.hpp"

#if defined(RELAY_HTTP_LOG) || defined(RELAY_HTTP_ERR)
#include <iostream>
#endif


#ifdef RELAY_HTTP_LOG
#define relayhttp_log(...)   (std::cout << "[" << relayhttp::Timestamp::getFormatedTimestamp() << "] [RELAYHTTP] [LOG] " << __VA_ARGS__ << std::endl)
#else // RELAY_HTTP_LOG
#define relayhttp_log(...)   ((void)0)
#endif // RELAY_HTTP_LOG


#ifdef RELAY_HTTP_ERR
#define relayhttp_error(...) (std::cerr << "[" << relayhttp::Timestamp::getFormatedTimestamp() << "] [RELAYHTTP] [ERR] " << __VA_ARGS__ << std::endl)
#else // RELAY_HTTP_ERR
#define relayhttp_error(...) ((void)0)
#endif // RELAY_HTTP_ERR


#endif // RELAY_HTTP_LOGS_HPP
