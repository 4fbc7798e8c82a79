/*
 * Module receiptConfig.cpp
 *
 * This module defines the methods of the receiptConfig_t
 * structure as declared in receiptConfig.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "receiptConfig.h"
#include <stdlib.h>
#include <string.h>
#include <stdio.h>

#include "debugPrint.h"

receiptConfig_t :: receiptConfig_t( void )
   : storeName()
   , dateFormat( "%Y-%m-%d %H:%M:%S" )
   , footerLines()
   , logoWidthDots( 384 )
   , logoMode( rasterMode_t::dithered )
   , printerPath( "-" )
   , chunkSize( 512 )
{
   footerLines.push_back( "Thank you for your order!" );
   footerLines.push_back( "Come back soon!" );
}

void splitFooter( char const               *value,
                  std::vector<std::string> &lines )
{
   lines.clear();
   char const *start = value ;
   while( 1 )
   {
      char const *bar = strchr( start, '|' );
      if( 0 == bar )
      {
         lines.push_back( start );
         break ;
      }
      lines.push_back( std::string( start, bar-start ) );
      start = bar+1 ;
   }
}

static bool envUnsigned( char const *name, unsigned &value )
{
   char const *s = getenv( name );
   if( s && *s )
   {
      char *end ;
      unsigned long v = strtoul( s, &end, 0 );
      if( ( '\0' == *end ) && ( 0 < v ) )
      {
         value = (unsigned)v ;
         return true ;
      }
      fprintf( stderr, "%s: invalid value %s\n", name, s );
   }
   return false ;
}

void receiptConfig_t :: fromEnvironment( void )
{
   char const *s ;
   if( 0 != ( s = getenv( "RECEIPT_STORE_NAME" ) ) )
      storeName = s ;
   if( ( 0 != ( s = getenv( "RECEIPT_DATE_FORMAT" ) ) ) && *s )
      dateFormat = s ;
   if( 0 != ( s = getenv( "RECEIPT_FOOTER" ) ) )
      splitFooter( s, footerLines );
   if( ( 0 != ( s = getenv( "RECEIPT_PRINTER" ) ) ) && *s )
      printerPath = s ;
   if( ( 0 != ( s = getenv( "RECEIPT_LOGO_MODE" ) ) ) && *s )
   {
      if( !rasterMode_t::parse( s, logoMode.type ) )
         fprintf( stderr, "RECEIPT_LOGO_MODE: invalid value %s\n", s );
   }

   envUnsigned( "RECEIPT_LOGO_WIDTH", logoWidthDots );
   envUnsigned( "RECEIPT_CHUNK_SIZE", chunkSize );

   debugPrint( "receipt config: logo %s/%u, printer %s, chunk %u\n",
               rasterMode_t::typeName( logoMode.type ), logoWidthDots,
               printerPath.c_str(), chunkSize );
}

