/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef SYSTEM_RUNNER_HH
#define SYSTEM_RUNNER_HH

#include <string>
#include <vector>

/* replace the current process image; only returns by throwing */
int ezexec( const std::vector< std::string > & command, const bool path_search = false );

/* run a command to completion, throwing if it exits with failure */
void run( const std::vector< std::string > & command );

/* run a command to completion and return what it printed (stdout and stderr),
   throwing if it exits with failure */
std::string run_and_capture( const std::vector< std::string > & command );

/* run a command to completion and return its exit status; never throws on
   a failure status, only on failure to start the command */
int run_for_status( const std::vector< std::string > & command, std::string & output );

std::string command_str( const std::vector< std::string > & command );

#endif /* SYSTEM_RUNNER_HH */
