/*
 * Module hexDump.cpp
 *
 * This module defines the methods of the hexDumper_t
 * class and the hexString() routine as declared in
 * hexDump.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "hexDump.h"
#include <stdio.h>
#include <string.h>

static char const hexChars[] = {
   "0123456789ABCDEF"
};

#define BYTESPERLINE 16

bool hexDumper_t :: nextLine( void )
{
   if( 0 == bytesLeft_ )
      return false ;

   unsigned const count = ( BYTESPERLINE < bytesLeft_ ) ? BYTESPERLINE : (unsigned)bytesLeft_ ;

   char *nextOut = lineBuf_ + snprintf( lineBuf_, sizeof( lineBuf_ ), "%08lx  ", addr_ & 0xFFFFFFFFUL );

   for( unsigned i = 0 ; i < BYTESPERLINE ; i++ )
   {
      if( i < count )
      {
         unsigned char const b = data_[i];
         *nextOut++ = hexChars[b>>4];
         *nextOut++ = hexChars[b&0x0f];
      }
      else
      {
         *nextOut++ = ' ' ;
         *nextOut++ = ' ' ;
      }
      *nextOut++ = ' ' ;
   }

   *nextOut++ = ' ' ;
   for( unsigned i = 0 ; i < count ; i++ )
   {
      char const c = (char)data_[i];
      *nextOut++ = ( ( ' ' <= c ) && ( '\x7f' > c ) ) ? c : '.' ;
   }
   *nextOut = '\0' ;

   data_      += count ;
   bytesLeft_ -= count ;
   addr_      += count ;
   return true ;
}

std::string hexString( void const   *data,
                       unsigned long size )
{
   std::string out ;
   if( 0 < size )
   {
      out.reserve( size*3 - 1 );
      unsigned char const *bytes = (unsigned char const *)data ;
      for( unsigned long i = 0 ; i < size ; i++ )
      {
         if( 0 < i )
            out += ' ' ;
         out += hexChars[bytes[i]>>4];
         out += hexChars[bytes[i]&0x0f];
      }
   }
   return out ;
}


#ifdef STANDALONE
#include "memFile.h"

int main( int argc, char const * const argv[] )
{
   if( 2 <= argc )
   {
      memFile_t fIn( argv[1] );
      if( fIn.worked() )
      {
         hexDumper_t dump( fIn.getData(), fIn.getLength() );
         while( dump.nextLine() )
            printf( "%s\n", dump.getLine() );
      }
      else
         fprintf( stderr, "Error %s opening %s\n", fIn.getError(), argv[1] );
   }
   else
      fprintf( stderr, "Usage : hexDump fileName\n" );

   return 0 ;
}

#endif
