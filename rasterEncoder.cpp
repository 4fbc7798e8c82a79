/*
 * Module rasterEncoder.cpp
 *
 * This module defines the methods of the rasterEncoder_t
 * class and the rasterCommand() routine as declared in
 * rasterEncoder.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "rasterEncoder.h"
#include "escCommands.h"
#include "imgScale.h"
#include "dither.h"
#include "bitPack.h"
#include "macros.h"
#include <string.h>
#include <stdio.h>

#include "debugPrint.h"

static char const *const modeNames[] = {
   "threshold"
,  "dithered"
,  "fast"
};

char const *rasterMode_t :: typeName( type_e t )
{
   if( (unsigned)t < dim( modeNames ) )
      return modeNames[t];
   return "unknown" ;
}

bool rasterMode_t :: parse( char const *name, type_e &t )
{
   for( unsigned i = 0 ; i < dim( modeNames ); i++ )
   {
      if( 0 == strcmp( name, modeNames[i] ) )
      {
         t = (type_e)i ;
         return true ;
      }
   }
   return false ;
}

void rasterCommand( monoBitmap_t const         &bitmap,
                    std::vector<unsigned char> &out )
{
   unsigned char dims[4];
   putLE16( bitmap.byteWidth, dims );
   putLE16( bitmap.dotHeight, dims+2 );

   out.reserve( out.size() + sizeof( escRasterImage ) + sizeof( dims ) + bitmap.rows.size() );
   out.insert( out.end(), escRasterImage, escRasterImage + sizeof( escRasterImage ) );
   out.insert( out.end(), dims, dims + sizeof( dims ) );
   out.insert( out.end(), bitmap.rows.begin(), bitmap.rows.end() );
}

rasterEncoder_t :: rasterEncoder_t( imageSource_t        &source,
                                    rasterConfig_t const &config )
   : source_( source )
   , config_( config )
{
}

bool rasterEncoder_t :: toBitmap( image_t const      &image,
                                  unsigned            maxWidthDots,
                                  rasterMode_t const &mode,
                                  monoBitmap_t       &bitmap,
                                  std::string        &errorMsg )
{
   bitmap.byteWidth = bitmap.dotHeight = 0 ;
   bitmap.rows.clear();

   if( !image.isLoaded() || ( 0 == image.width_ ) || ( 0 == image.height_ ) )
   {
      errorMsg = "empty image" ;
      return false ;
   }

   bool const fast = ( rasterMode_t::fast == mode.type );
   if( 0 == maxWidthDots )
      maxWidthDots = fast ? config_.fastMaxWidthDots : config_.maxWidthDots ;

   unsigned width, height ;
   scaledSize( image.width_, image.height_, maxWidthDots, width, height );
   if( fast )
   {
      unsigned skip = ( 0 < mode.lineSkip ) ? mode.lineSkip : config_.lineSkip ;
      if( 0 == skip )
         skip = 1 ;
      height /= skip ;
      if( 0 == height )
         height = 1 ;
   }

   if( 0xFFFF < height )
   {
      char msg[80];
      snprintf( msg, sizeof( msg ), "image too tall (%u dots)", height );
      errorMsg = msg ;
      return false ;
   }

   if( 0xFFFF < rasterByteWidth( width ) )
   {
      char msg[80];
      snprintf( msg, sizeof( msg ), "image too wide (%u dots)", width );
      errorMsg = msg ;
      return false ;
   }

   image_t scaled ;
   image_t const *pixels = &image ;
   if( ( width != image.width_ ) || ( height != image.height_ ) )
   {
      if( !source_.resize( image, width, height, fast, scaled ) )
      {
         errorMsg = "error resizing image" ;
         return false ;
      }
      pixels = &scaled ;
   }

   ditherLevels_t levels ;
   levels.alphaCutoff = config_.alphaCutoff ;
   levels.darkCutoff  = config_.darkCutoff ;
   levels.lightCutoff = config_.lightCutoff ;
   levels.threshold   = ( 0 < mode.level ) ? mode.level : config_.threshold ;
   levels.fastLuma    = fast ;

   dither_t dither( *pixels, levels, rasterMode_t::dithered == mode.type );

   bitmap.byteWidth = dither.bytesPerRow();
   bitmap.dotHeight = dither.getHeight();
   bitmap.rows.assign( dither.getBits(), dither.getBits() + ( bitmap.byteWidth*bitmap.dotHeight ) );

   debugPrint( "%s raster: %ux%u -> %u bytes x %u dots\n",
               rasterMode_t::typeName( mode.type ),
               image.width_, image.height_,
               bitmap.byteWidth, bitmap.dotHeight );
   return true ;
}

bool rasterEncoder_t :: encode( image_t const              &image,
                                unsigned                    maxWidthDots,
                                rasterMode_t const         &mode,
                                std::vector<unsigned char> &out,
                                std::string                &errorMsg )
{
   monoBitmap_t bitmap ;
   if( !toBitmap( image, maxWidthDots, mode, bitmap, errorMsg ) )
      return false ;

   rasterCommand( bitmap, out );
   return true ;
}

bool rasterEncoder_t :: encodeURL( char const                 *url,
                                   unsigned                    maxWidthDots,
                                   rasterMode_t const         &mode,
                                   std::vector<unsigned char> &out,
                                   std::string                &errorMsg )
{
   image_t image ;
   if( !source_.load( url, image, errorMsg ) )
      return false ;

   return encode( image, maxWidthDots, mode, out, errorMsg );
}


#ifdef STANDALONE
#include <stdlib.h>

int main( int argc, char const * const argv[] )
{
   if( 2 <= argc )
   {
      rasterMode_t mode ;
      if( ( 3 <= argc ) && !rasterMode_t::parse( argv[2], mode.type ) )
      {
         fprintf( stderr, "Invalid mode %s\n", argv[2] );
         return -1 ;
      }
      unsigned const width = ( 4 <= argc ) ? strtoul( argv[3], 0, 0 ) : 0 ;

      urlImageSource_t source ;
      rasterEncoder_t encoder( source );
      std::vector<unsigned char> out ;
      std::string errorMsg ;
      if( encoder.encodeURL( argv[1], width, mode, out, errorMsg ) )
         fwrite( &out[0], out.size(), 1, stdout );
      else
         fprintf( stderr, "%s\n", errorMsg.c_str() );
   }
   else
      fprintf( stderr, "Usage: %s url [threshold|dithered|fast [width]]\n", argv[0] );
   return 0 ;
}

#endif
