/*
 * Module memFile.cpp
 *
 * This module defines the methods of the memFile_t
 * class as declared in memFile.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "memFile.h"
#include <fcntl.h>
#include <unistd.h>
#include <string.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <errno.h>

#include "debugPrint.h"

memFile_t :: memFile_t( char const   *path,
                        unsigned long maxLength )
   : data_( 0 )
   , length_( 0 )
   , mapped_( false )
   , errno_( 0 )
{
   int const fd = open( path, O_RDONLY );
   if( 0 > fd )
   {
      errno_ = errno ;
      return ;
   }

   struct stat st ;
   if( 0 != fstat( fd, &st ) )
      errno_ = errno ;
   else if( S_ISREG( st.st_mode ) && ( 0 < st.st_size ) )
   {
      if( (unsigned long)st.st_size > maxLength )
         errno_ = EFBIG ;
      else
         map( fd, st.st_size );
   }
   else
      slurp( fd, maxLength );

   // a mapping outlives its descriptor
   close( fd );
   debugPrint( "%s: %lu bytes %s\n", path, length_, mapped_ ? "mapped" : "read" );
}

bool memFile_t :: map( int fd, unsigned long size )
{
   void *mem = mmap( 0, size, PROT_READ, MAP_PRIVATE, fd, 0 );
   if( MAP_FAILED == mem )
   {
      errno_ = errno ;
      return false ;
   }
   data_   = mem ;
   length_ = size ;
   mapped_ = true ;
   return true ;
}

bool memFile_t :: slurp( int fd, unsigned long maxLength )
{
   unsigned long allocated = 4096 ;
   unsigned long used = 0 ;
   unsigned char *buf = new unsigned char [allocated];
   while( 1 )
   {
      if( used == allocated )
      {
         if( allocated > maxLength )
         {
            errno_ = EFBIG ;
            break ;
         }
         unsigned long const newSize = ( 2*allocated > maxLength+1 ) ? maxLength+1 : 2*allocated ;
         unsigned char *bigger = new unsigned char [newSize];
         memcpy( bigger, buf, used );
         delete [] buf ;
         buf = bigger ;
         allocated = newSize ;
      }
      ssize_t const numRead = read( fd, buf+used, allocated-used );
      if( 0 < numRead )
         used += numRead ;
      else if( 0 == numRead )
         break ;
      else if( EINTR != errno )
      {
         errno_ = errno ;
         break ;
      }
   }

   if( ( 0 == errno_ ) && ( used > maxLength ) )
      errno_ = EFBIG ;
   else if( ( 0 == errno_ ) && ( 0 == used ) )
      errno_ = EINVAL ;

   if( 0 != errno_ )
   {
      delete [] buf ;
      return false ;
   }

   data_   = buf ;
   length_ = used ;
   return true ;
}

memFile_t :: ~memFile_t( void )
{
   if( mapped_ )
      munmap( (void *)data_, length_ );
   else
      delete [] (unsigned char const *)data_ ;
}

char const *memFile_t :: getError( void ) const
{
   return strerror( errno_ );
}

