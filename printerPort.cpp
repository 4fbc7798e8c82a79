/*
 * Module printerPort.cpp
 *
 * This module defines the methods of the devicePort_t
 * class as declared in printerPort.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "printerPort.h"
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>
#include <stdio.h>

#include "debugPrint.h"

devicePort_t :: devicePort_t( char const *path, unsigned chunkSize )
   : path_( path )
   , chunkSize_( ( 0 < chunkSize ) ? chunkSize : (unsigned)defaultChunkSize )
   , fd_( -1 )
   , ownFd_( false )
   , errno_( 0 )
   , bytesWritten_( 0 )
{
   if( 0 == strcmp( "-", path ) )
      fd_ = fileno( stdout );
   else
   {
      fd_ = open( path, O_WRONLY | O_CREAT | O_TRUNC | O_NOCTTY, 0644 );
      if( 0 <= fd_ )
      {
         ownFd_ = true ;
         fcntl( fd_, F_SETFD, FD_CLOEXEC );
      }
      else
         errno_ = errno ;
   }
}

devicePort_t :: ~devicePort_t( void )
{
   if( ownFd_ && ( 0 <= fd_ ) )
      close( fd_ );
}

char const *devicePort_t :: getError( void ) const
{
   return strerror( errno_ );
}

bool devicePort_t :: write( void const   *data,
                            unsigned long length,
                            std::string  &errorMsg )
{
   errorMsg.clear();
   if( !isOpen() )
   {
      errorMsg = path_ + ": " + getError();
      return false ;
   }

   char const *next = (char const *)data ;
   unsigned long left = length ;
   while( 0 < left )
   {
      unsigned long const chunk = ( left > chunkSize_ ) ? chunkSize_ : left ;
      ssize_t const numWritten = ::write( fd_, next, chunk );
      if( (ssize_t)chunk != numWritten )
      {
         char msg[128];
         if( 0 > numWritten )
         {
            errno_ = errno ;
            snprintf( msg, sizeof( msg ), "%s: %s after %lu of %lu bytes",
                      path_.c_str(), strerror( errno_ ), length-left, length );
         }
         else
            snprintf( msg, sizeof( msg ), "%s: short write (%ld of %lu) after %lu of %lu bytes",
                      path_.c_str(), (long)numWritten, chunk, length-left, length );
         errorMsg = msg ;
         if( 0 < numWritten )
            bytesWritten_ += numWritten ;
         return false ;
      }
      next += chunk ;
      left -= chunk ;
      bytesWritten_ += chunk ;
   }

   debugPrint( "%s: wrote %lu bytes\n", path_.c_str(), length );
   return true ;
}

