/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef UTIL_HH
#define UTIL_HH

#include <string>
#include <vector>

void check_requirements( const int argc, const char * const argv[] );
std::string safe_getenv( const std::string & key );
std::string safe_getenv_or( const std::string & key, const std::string & def_val );
unsigned int parse_unsigned( const std::string & str, const std::string & what );
std::string join( const std::vector< std::string > & command );
std::string trim( const std::string & str );
void split( const std::string & s, char delim, std::vector< std::string > & elems );
std::vector< std::string > split( const std::string & s, char delim );

#endif /* UTIL_HH */
