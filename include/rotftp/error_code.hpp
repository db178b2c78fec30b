#ifndef __ROTFTP_ERROR_CODE_HPP__
#define __ROTFTP_ERROR_CODE_HPP__

#include <cstdint>

namespace rotftp {
typedef uint32_t error_code;
namespace error {
const error_code no_error                = 0;
//-------------------------------------------------------------------------------------------------
// Error code 101-999 are specific to application
// Peer didn't acknowledge a block within the retry budget
const error_code receive_timeout         = 102;
// Peer aborted the transfer with an error packet
const error_code peer_error_response     = 104;
const error_code user_requested_abort    = 109;

//-------------------------------------------------------------------------------------------------
// Boost Asio error codes are bubbled up to user by adding to this base
// For example if boost::asio give error code 7 then user will be called back with boost_asio_error_base + 7
// This range is reserved upto boost_asio_error_base + 999
const error_code boost_asio_error_base   = 1000;

//-------------------------------------------------------------------------------------------------
} // namespace error

// Short description of an application error code for log records
const char *describe(error_code e);
} // namespace rotftp

#endif
