/*
 * Module barcodeEncoder.cpp
 *
 * This module defines the methods of the barcodeEncoder_t
 * class and the symbology name routines as declared in
 * barcodeEncoder.h
 *
 * Validation goes through a table with one routine per
 * symbology.
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "barcodeEncoder.h"
#include "escCommands.h"
#include "hexDump.h"
#include "macros.h"
#include <string.h>
#include <stdio.h>

#include "debugPrint.h"

char const *const barcodeSymbologyNames[BC_NUMSYMBOLOGIES] = {
   "UPC_A"
,  "EAN13"
,  "EAN8"
,  "CODE39"
,  "ITF"
,  "CODE128"
};

//
// <GS>k function A/B values (UPC-A, EAN13, EAN8, CODE39, ITF
// are function A, CODE128 is function B)
//
static unsigned char const defaultTypeCodes[BC_NUMSYMBOLOGIES] = {
   0        // UPC_A
,  2        // EAN13
,  3        // EAN8
,  4        // CODE39
,  5        // ITF
,  73       // CODE128
};

static char const code39Chars[] = {
   "0123456789"
   "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
   "-. $/+%"
};

bool parseSymbology( char const *name, barcodeSymbology_e &sym )
{
   for( unsigned i = 0 ; i < BC_NUMSYMBOLOGIES ; i++ )
   {
      if( 0 == strcmp( name, barcodeSymbologyNames[i] ) )
      {
         sym = (barcodeSymbology_e)i ;
         return true ;
      }
   }
   return false ;
}

char const *symbologyName( barcodeSymbology_e sym )
{
   if( (unsigned)sym < BC_NUMSYMBOLOGIES )
      return barcodeSymbologyNames[sym];
   return "CODE128" ;
}

static bool allDigits( std::string const &payload )
{
   for( unsigned i = 0 ; i < payload.size(); i++ )
   {
      if( ( payload[i] < '0' ) || ( payload[i] > '9' ) )
         return false ;
   }
   return true ;
}

static bool fixedDigits( char const        *name,
                         std::string const &payload,
                         unsigned           shortLen,
                         std::string       &errorMsg )
{
   char msg[80];
   if( !allDigits( payload ) )
   {
      snprintf( msg, sizeof( msg ), "%s: digits only", name );
      errorMsg = msg ;
      return false ;
   }
   if( ( shortLen != payload.size() ) && ( shortLen+1 != payload.size() ) )
   {
      snprintf( msg, sizeof( msg ), "%s: must be exactly %u or %u digits, not %u",
                name, shortLen, shortLen+1, (unsigned)payload.size() );
      errorMsg = msg ;
      return false ;
   }
   return true ;
}

static bool validUPCA( std::string const &payload, std::string &errorMsg )
{
   return fixedDigits( "UPC_A", payload, 11, errorMsg );
}

static bool validEAN13( std::string const &payload, std::string &errorMsg )
{
   return fixedDigits( "EAN13", payload, 12, errorMsg );
}

static bool validEAN8( std::string const &payload, std::string &errorMsg )
{
   return fixedDigits( "EAN8", payload, 7, errorMsg );
}

static bool validCode39( std::string const &payload, std::string &errorMsg )
{
   for( unsigned i = 0 ; i < payload.size(); i++ )
   {
      char const c = payload[i];
      if( ( '\0' == c ) || ( 0 == strchr( code39Chars, c ) ) )
      {
         char msg[120];
         snprintf( msg, sizeof( msg ),
                   "CODE39: invalid character 0x%02x at %u (allowed 0-9 A-Z - . space $ / + %%)",
                   (unsigned char)c, i );
         errorMsg = msg ;
         return false ;
      }
   }
   return true ;
}

static bool validITF( std::string const &payload, std::string &errorMsg )
{
   if( !allDigits( payload ) )
   {
      errorMsg = "ITF: digits only" ;
      return false ;
   }
   if( payload.size() & 1 )
   {
      errorMsg = "ITF: needs an even number of digits" ;
      return false ;
   }
   return true ;
}

static bool validCode128( std::string const &payload, std::string &errorMsg )
{
   if( payload.empty() )
   {
      errorMsg = "CODE128: payload is empty" ;
      return false ;
   }
   return true ;
}

typedef bool (*validator_t)( std::string const &payload, std::string &errorMsg );

static validator_t const validators[BC_NUMSYMBOLOGIES] = {
   validUPCA
,  validEAN13
,  validEAN8
,  validCode39
,  validITF
,  validCode128
};

barcodeConfig_t :: barcodeConfig_t( void )
   : unknownTypeCode( defaultTypeCodes[BC_CODE128] )
{
   memcpy( typeCodes, defaultTypeCodes, sizeof( typeCodes ) );
}

barcodeEncoder_t :: barcodeEncoder_t( barcodeConfig_t const &config )
   : config_( config )
{
}

bool barcodeEncoder_t :: lengthPrefixed( barcodeSymbology_e sym )
{
   return ( BC_UPC_A != sym ) && ( BC_EAN13 != sym ) && ( BC_EAN8 != sym );
}

bool barcodeEncoder_t :: validate( std::string const  &payload,
                                   barcodeSymbology_e  sym,
                                   std::string        &errorMsg )
{
   errorMsg.clear();
   char const *const name = symbologyName( sym );
   if( lengthPrefixed( sym ) && ( maxPrefixedLength < payload.size() ) )
   {
      char msg[80];
      snprintf( msg, sizeof( msg ), "%s: payload longer than %u bytes",
                name, (unsigned)maxPrefixedLength );
      errorMsg = msg ;
      return false ;
   }

   validator_t const v = ( (unsigned)sym < BC_NUMSYMBOLOGIES )
                         ? validators[sym]
                         : validCode128 ;
   return v( payload, errorMsg );
}

unsigned char barcodeEncoder_t :: typeCode( barcodeSymbology_e sym ) const
{
   if( (unsigned)sym < BC_NUMSYMBOLOGIES )
      return config_.typeCodes[sym];
   return config_.unknownTypeCode ;
}

static unsigned char clamp( int value, int minValue, int maxValue )
{
   if( value < minValue )
      return (unsigned char)minValue ;
   if( value > maxValue )
      return (unsigned char)maxValue ;
   return (unsigned char)value ;
}

static void addCommand( std::vector<unsigned char> &out,
                        unsigned char const         prefix[2],
                        unsigned char               param )
{
   out.push_back( prefix[0] );
   out.push_back( prefix[1] );
   out.push_back( param );
}

bool barcodeEncoder_t :: encode( std::string const          &payload,
                                 barcodeSpec_t const        &spec,
                                 std::vector<unsigned char> &out,
                                 std::string                &errorMsg ) const
{
   if( !validate( payload, spec.symbology, errorMsg ) )
   {
      debugPrint( "%s\n", errorMsg.c_str() );
      return false ;
   }

   out.insert( out.end(), escInitPrinter, escInitPrinter + sizeof( escInitPrinter ) );
   addCommand( out, escBarcodeHeight, clamp( spec.heightDots, 1, 255 ) );
   addCommand( out, escBarcodeWidth, clamp( spec.moduleWidth, 2, 6 ) );
   addCommand( out, escBarcodeHRIPos, clamp( spec.hriPosition, HRI_NONE, HRI_BOTH ) );
   addCommand( out, escBarcodeHRIFont, clamp( spec.hriFont, HRI_FONT_A, HRI_FONT_B ) );
   addCommand( out, escBarcodePrint, typeCode( spec.symbology ) );

   if( lengthPrefixed( spec.symbology ) )
   {
      out.push_back( (unsigned char)payload.size() );
      out.insert( out.end(), payload.begin(), payload.end() );
   }
   else
   {
      out.insert( out.end(), payload.begin(), payload.end() );
      out.push_back( 0 );
   }

   out.insert( out.end(), spec.lineFeeds, (unsigned char)'\n' );
   return true ;
}

bool barcodeHex( std::string const   &payload,
                 barcodeSpec_t const &spec,
                 std::string         &hex,
                 std::string         &errorMsg )
{
   hex.clear();
   barcodeEncoder_t encoder ;
   std::vector<unsigned char> bytes ;
   if( !encoder.encode( payload, spec, bytes, errorMsg ) )
      return false ;

   hex = hexString( bytes.empty() ? 0 : &bytes[0], bytes.size() );
   return true ;
}


#ifdef STANDALONE

int main( int argc, char const * const argv[] )
{
   if( 3 <= argc )
   {
      barcodeSpec_t spec ;
      if( !parseSymbology( argv[1], spec.symbology ) )
      {
         fprintf( stderr, "Unknown symbology %s\n", argv[1] );
         return -1 ;
      }

      std::string hex, errorMsg ;
      if( barcodeHex( argv[2], spec, hex, errorMsg ) )
         printf( "%s\n", hex.c_str() );
      else
         fprintf( stderr, "%s\n", errorMsg.c_str() );
   }
   else
      fprintf( stderr, "Usage: %s symbology payload\n", argv[0] );
   return 0 ;
}

#endif
