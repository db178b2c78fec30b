#include "rotftp/error_code.hpp"

const char *rotftp::describe(error_code e) {
  switch (e) {
  case error::no_error:
    return "no error";
  case error::receive_timeout:
    return "exhausted retries";
  case error::peer_error_response:
    return "peer sent error";
  case error::user_requested_abort:
    return "aborted";
  default:
    break;
  }
  if (e >= error::boost_asio_error_base) {
    return "network error";
  }
  return "unknown error";
}
