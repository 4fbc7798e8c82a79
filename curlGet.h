#ifndef __CURLGET_H__
#define __CURLGET_H__ "$Id$"

/*
 * curlGet.h
 *
 * This header file declares the curlGet() routine, which
 * simply retrieves a URL into memory.
 *
 * HTTP errors (4xx, 5xx) count as failures, redirects
 * are followed, and the transfer is abandoned after
 * timeoutSecs. There are no retries.
 *
 * On failure, errorMsg describes what went wrong.
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

#include <string>

bool curlGet( char const  *url,
              std::string &data,         // output
              std::string &errorMsg,     // output
              long         timeoutSecs = 30 );

#endif

