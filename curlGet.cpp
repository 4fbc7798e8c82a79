/*
 * Module curlGet.cpp
 *
 * This module defines the curlGet() routine,
 * as declared in curlGet.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "curlGet.h"
#include <string.h>
#include <stdio.h>
#include <pthread.h>
#include <curl/curl.h>

#include "debugPrint.h"

static pthread_once_t curlOnce = PTHREAD_ONCE_INIT ;
static CURLcode       curlInit = CURLE_OK ;

//
// curl_global_init() isn't thread-safe, and logos are
// fetched from worker threads.
//
static void initCurl( void )
{
   curlInit = curl_global_init( CURL_GLOBAL_ALL );
}

static size_t writeData( void *buffer, size_t size, size_t nmemb, void *userp )
{
   size_t const total = size*nmemb;
   std::string *pS = (std::string *)userp ;
   pS->append( (char *)buffer, total );
   return total ;
}

bool curlGet( char const  *url,
              std::string &data,
              std::string &errorMsg,
              long         timeoutSecs )
{
   data.clear();
   errorMsg.clear();

   pthread_once( &curlOnce, initCurl );
   if( CURLE_OK != curlInit )
   {
      errorMsg = curl_easy_strerror( curlInit );
      return false ;
   }

   CURL *cHandle = curl_easy_init();
   if( 0 == cHandle )
   {
      errorMsg = "Error allocating curl handle" ;
      return false ;
   }

   char errorBuf[CURL_ERROR_SIZE];
   errorBuf[0] = '\0' ;

   CURLcode result = curl_easy_setopt( cHandle, CURLOPT_URL, url );
   if( CURLE_OK == result )
      result = curl_easy_setopt( cHandle, CURLOPT_ERRORBUFFER, errorBuf );
   if( CURLE_OK == result )
      result = curl_easy_setopt( cHandle, CURLOPT_WRITEFUNCTION, writeData );
   if( CURLE_OK == result )
      result = curl_easy_setopt( cHandle, CURLOPT_WRITEDATA, &data );
   if( CURLE_OK == result )
      result = curl_easy_setopt( cHandle, CURLOPT_FOLLOWLOCATION, 1L );
   if( CURLE_OK == result )
      result = curl_easy_setopt( cHandle, CURLOPT_FAILONERROR, 1L );
   if( CURLE_OK == result )
      result = curl_easy_setopt( cHandle, CURLOPT_NOSIGNAL, 1L );
   if( CURLE_OK == result )
      result = curl_easy_setopt( cHandle, CURLOPT_TIMEOUT, timeoutSecs );
   if( CURLE_OK == result )
      result = curl_easy_perform( cHandle );

   if( CURLE_OK != result )
   {
      errorMsg = ( '\0' != errorBuf[0] ) ? errorBuf : curl_easy_strerror( result );
      data.clear();
   }
   else
      debugPrint( "%s: %lu bytes\n", url, (unsigned long)data.size() );

   curl_easy_cleanup( cHandle );

   return CURLE_OK == result ;
}


#ifdef STANDALONE
#include <errno.h>

int main( int argc, char const * const argv[] )
{
   int returnVal ;

   if( ( 2 == argc ) || ( 3 == argc ) )
   {
      std::string data ;
      std::string errorMsg ;
      if( curlGet( argv[1], data, errorMsg ) )
      {
         printf( "%lu bytes received\n", (unsigned long)data.size() );
         if( 3 == argc )
         {
            FILE *f = fopen( argv[2], "wb" );
            if( f )
            {
               fwrite( data.c_str(), data.size(), 1, f );
               fclose( f );
            }
            else
               perror( argv[2] );
         }
         returnVal = 0 ;
      }
      else
      {
         fprintf( stderr, "Error getting %s: %s\n", argv[1], errorMsg.c_str() );
         returnVal = ENOENT ;
      }
   }
   else
   {
      fprintf( stderr, "Usage : curlGet url [saveFileName]\n" );
      returnVal = EINVAL ;
   }

   return returnVal ;
}

#endif
