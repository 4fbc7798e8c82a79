/*
 * Module dither.cpp
 *
 * This module defines the methods of the dither_t class,
 * which is used to generate and store the results of the
 * classification and Floyd-Steinberg dither as described
 * in dither.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "dither.h"
#include "bitPack.h"
#include <string.h>

//
// values are kept in thousandths of a luma step
//
#define LUMASCALE    1000L
#define MAXVALUE     (255*LUMASCALE)
#define MIDPOINT     (128*LUMASCALE)

static long const downDithers[] = {
   3, 5, 1
};

static long const rightDither = 7 ;

unsigned long dither_t :: luma( unsigned char const *rgba, bool fastLuma )
{
   if( fastLuma )
      return ( ( (unsigned long)rgba[0] + rgba[1] + rgba[2] ) * LUMASCALE ) / 3 ;
   else
      return ( 299UL*rgba[0] ) + ( 587UL*rgba[1] ) + ( 114UL*rgba[2] );
}

dither_t::pixelClass_e dither_t :: classify( unsigned char const  *rgba,
                                             ditherLevels_t const &levels,
                                             unsigned long        &l )
{
   l = luma( rgba, levels.fastLuma );
   if( rgba[3] < levels.alphaCutoff )
      return noPrint ;
   if( l < levels.darkCutoff*LUMASCALE )
      return noPrint ;
   if( l > levels.lightCutoff*LUMASCALE )
      return print ;
   return midRange ;
}

static void classifyRow( image_t const        &image,
                         unsigned              y,
                         ditherLevels_t const &levels,
                         unsigned char        *classes,
                         long                 *values )
{
   unsigned char const *pix = image.pixel( 0, y );
   for( unsigned x = 0 ; x < image.width_ ; x++, pix += image_t::bytesPerPixel )
   {
      unsigned long l ;
      classes[x] = dither_t::classify( pix, levels, l );
      values[x] = (long)l ;
   }
}

//
// add error to a neighbor if it's still up for grabs
//
static inline void spread( unsigned char const *classes,
                           long                *values,
                           unsigned             width,
                           long                 x,
                           long                 error )
{
   if( ( 0 <= x ) && ( x < (long)width ) && ( dither_t::midRange == classes[x] ) )
   {
      long v = values[x] + error ;
      if( v < 0 )
         v = 0 ;
      else if( v > MAXVALUE )
         v = MAXVALUE ;
      values[x] = v ;
   }
}

dither_t :: dither_t( image_t const        &image,
                      ditherLevels_t const &levels,
                      bool                  diffuse )
   : width_( image.width_ )
   , height_( image.height_ )
   , bytesPerRow_( rasterByteWidth( image.width_ ) )
   , bits_( new unsigned char [ bytesPerRow_*height_ + 1 ] )
{
   memset( bits_, 0, bytesPerRow_*height_ );
   if( ( 0 == width_ ) || ( 0 == height_ ) )
      return ;

   //
   // two rows of classes and values: the one being
   // output and the one below it, which gathers the
   // downward errors
   //
   unsigned char *classes[2] = {
      new unsigned char [width_],
      new unsigned char [width_]
   };
   long *values[2] = {
      new long [width_],
      new long [width_]
   };
   unsigned char *const dots = new unsigned char [width_];

   long const threshold = levels.threshold*LUMASCALE ;

   classifyRow( image, 0, levels, classes[0], values[0] );
   for( unsigned y = 0 ; y < height_ ; y++ )
   {
      unsigned const cur  = y & 1 ;
      unsigned const next = (~y) & 1 ;
      bool const haveNext = ( y+1 < height_ );
      if( haveNext )
         classifyRow( image, y+1, levels, classes[next], values[next] );

      for( unsigned x = 0 ; x < width_ ; x++ )
      {
         switch( classes[cur][x] )
         {
            case noPrint :
               dots[x] = 0 ;
               break ;
            case print :
               dots[x] = 1 ;
               break ;
            default :
               if( !diffuse )
                  dots[x] = ( values[cur][x] < threshold );
               else {
                  long const old = values[cur][x];
                  long const quantized = ( old > MIDPOINT ) ? MAXVALUE : 0 ;
                  dots[x] = ( 0 == quantized );

                  long const diff = old - quantized ;
                  spread( classes[cur], values[cur], width_, (long)x+1, (rightDither*diff)/16 );
                  if( haveNext )
                  {
                     for( unsigned d = 0 ; d < 3 ; d++ )
                        spread( classes[next], values[next], width_, (long)x+d-1, (downDithers[d]*diff)/16 );
                  }
               }
         }
      }
      packRow( dots, width_, bits_ + (y*bytesPerRow_) );
   }

   delete [] dots ;
   delete [] values[0];
   delete [] values[1];
   delete [] classes[0];
   delete [] classes[1];
}


#ifdef STANDALONE
#include "imgFile.h"
#include <stdio.h>

int main( int argc, char const * const argv[] )
{
   if( 2 <= argc )
   {
      image_t image ;
      if( imageFromFile( argv[1], image ) )
      {
         ditherLevels_t levels ;
         dither_t dither( image, levels, true );
         for( unsigned y = 0 ; y < dither.getHeight(); y++ )
         {
            for( unsigned x = 0 ; x < dither.getWidth(); x++ )
               putchar( dither.prints( x, y ) ? '#' : '.' );
            putchar( '\n' );
         }
      }
      else
         fprintf( stderr, "Error loading %s\n", argv[1] );
   }
   else
      fprintf( stderr, "Usage: dither fileName\n" );
   return 0 ;
}

#endif
