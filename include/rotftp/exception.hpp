#ifndef __ROTFTP_EXCEPTION_HPP__
#define __ROTFTP_EXCEPTION_HPP__

#include <exception>
#include <string>
namespace rotftp {

// Base exception class
class exception : public std::exception {
public:
  exception(const std::string &err_message) : std::exception(), message(err_message) {}
  virtual const char *what() const throw() { return this->message.c_str(); }

protected:
  const std::string message;
};

// Invalid frame, can't be parsed
class framing_exception : public exception {
  using exception::exception;
};

// An invalid parameter is encountered for example mode "netascii" or an empty file name
class invalid_frame_parameter_exception : public framing_exception {
  using framing_exception::framing_exception;
};

// Frame is shorter than its header or a NUL terminated field is not terminated
class partial_frame_exception : public framing_exception {
  using framing_exception::framing_exception;
};

// Frame is longer than the largest datagram tftp allows
class oversized_frame_exception : public framing_exception {
  using framing_exception::framing_exception;
};

// Frame carries an op code other than the one the caller is decoding
class frame_type_mismatch_exception : public framing_exception {
  using framing_exception::framing_exception;
};

// Server can't start with given configuration
class invalid_config_exception : public exception {
  using exception::exception;
};

// File to be served couldn't be loaded
class payload_exception : public exception {
  using exception::exception;
};

} // namespace rotftp
#endif //__ROTFTP_EXCEPTION_HPP__
