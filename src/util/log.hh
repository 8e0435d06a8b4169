/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef LOG_HH
#define LOG_HH

#include <ostream>
#include <string>

/* process-wide verbosity for progress output */
enum class LogLevel { Error, Warning, Info, Debug };

void set_log_level( const LogLevel level );

/* accepts "error", "warning", "info" or "debug" */
void set_log_level( const std::string & name );

LogLevel log_level( void );

/* errors and warnings go to stderr, the rest to stdout; messages above
   the current verbosity go nowhere */
std::ostream & log_at( const LogLevel level );

inline std::ostream & info( void ) { return log_at( LogLevel::Info ); }
inline std::ostream & debug( void ) { return log_at( LogLevel::Debug ); }
inline std::ostream & warning( void ) { return log_at( LogLevel::Warning ); }

#endif /* LOG_HH */
