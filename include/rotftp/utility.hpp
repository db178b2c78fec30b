#ifndef __ROTFTP_UTILITY_HPP__
#define __ROTFTP_UTILITY_HPP__

#include <utility>  // before asio: Boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>
#include <sstream>
#include <string>

/* to_string overloads are meant for log records, callers use to_string(x).c_str() with printf style macros
 */
inline std::string to_string(const boost::asio::ip::udp::endpoint &endpoint) {
  std::stringstream ss;
  ss << endpoint;
  return ss.str();
}

inline std::string to_string(const boost::system::error_code &error) {
  std::stringstream ss;
  ss << error.category().name() << ":" << error.value() << " " << error.message();
  return ss.str();
}

#endif
