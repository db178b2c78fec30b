#ifndef __ROTFTP_LOG_HPP__
#define __ROTFTP_LOG_HPP__

#include <syslog.h>
#include "rotftp/project_config.hpp"

/* Log records go to syslog. rotftpd opens the log with LOG_PERROR so records are mirrored on stderr,
 * unit tests don't call openlog and get the syslog defaults.
 */
#define DEBUG(...)  syslog(LOG_DEBUG, ##__VA_ARGS__)
#define INFO(...)   syslog(LOG_INFO, ##__VA_ARGS__)
#define NOTICE(...) syslog(LOG_NOTICE, ##__VA_ARGS__)
#define WARN(...)   syslog(LOG_WARNING, ##__VA_ARGS__)
#define ERROR(...)  syslog(LOG_ERR, ##__VA_ARGS__)

#ifdef ROTFTP_CONF_EXTENSIVE_DEBUG_LOG
#define XDEBUG(...) syslog(LOG_DEBUG, ##__VA_ARGS__)
#else
#define XDEBUG(...)
#endif

#endif
