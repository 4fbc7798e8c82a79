/*
 * Module imgGIF.cpp
 *
 * This module defines the imageGIF() routine as declared
 * in imgGIF.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "imgGIF.h"
extern "C" {
#include <gif_lib.h>
};
#include <unistd.h>
#include <string.h>
#include <stdio.h>

#include "debugPrint.h"

#if defined( GIFLIB_MAJOR ) && ( GIFLIB_MAJOR >= 5 )
#define GIFOPEN( __src, __read ) DGifOpen( __src, __read, 0 )
#else
#define GIFOPEN( __src, __read ) DGifOpen( __src, __read )
#endif

#if defined( GIFLIB_MAJOR ) && ( ( GIFLIB_MAJOR > 5 ) || ( ( GIFLIB_MAJOR == 5 ) && ( GIFLIB_MINOR >= 1 ) ) )
#define GIFCLOSE( __f ) DGifCloseFile( __f, 0 )
#else
#define GIFCLOSE( __f ) DGifCloseFile( __f )
#endif

//
// giflib 5 DGifSlurp() stores interlaced frames in row order
//
#if defined( GIFLIB_MAJOR ) && ( GIFLIB_MAJOR >= 5 )
#define SLURPDEINTERLACES 1
#else
#define SLURPDEINTERLACES 0
#endif

#define GRAPHICSCONTROL 0xF9

//
// anything bigger than this isn't a receipt logo
//
#define MAXPIXELS (16UL<<20)

typedef struct {
   GifByteType const *data_ ;
   size_t             length_ ;
   size_t             numRead_ ;
} gifSrc_t ;

static int gifRead( GifFileType *fIn, GifByteType *data, int count )
{
   gifSrc_t &src = *( gifSrc_t * )fIn->UserData ;
   unsigned const left = src.length_ - src.numRead_ ;
   if( (unsigned)count > left )
      count = left ;

   memcpy( data, src.data_+src.numRead_, count );
   src.numRead_ += count ;

   return count ;
}

//
// returns the transparent color index from the graphics
// control extension of the frame, or -1 if there isn't one
//
static int transparentIndex( SavedImage const &image )
{
   for( int i = 0 ; i < image.ExtensionBlockCount ; i++ )
   {
      ExtensionBlock const &ext = image.ExtensionBlocks[i];
      if( ( GRAPHICSCONTROL == ext.Function )
          &&
          ( 4 <= ext.ByteCount )
          &&
          ( 0 != ( ext.Bytes[0] & 1 ) ) )
      {
         return (unsigned char)ext.Bytes[3];
      }
   }
   return -1 ;
}

static void setColor( unsigned char        *pix,
                      ColorMapObject const &map,
                      int                   idx,
                      int                   transparent )
{
   if( ( idx == transparent ) || ( idx >= map.ColorCount ) )
   {
      pix[0] = pix[1] = pix[2] = 0xFF ;
      pix[3] = 0 ;
   }
   else
   {
      GifColorType const &rgb = map.Colors[idx];
      pix[0] = rgb.Red ;
      pix[1] = rgb.Green ;
      pix[2] = rgb.Blue ;
      pix[3] = 0xFF ;
   }
}

static int const InterlacedOffset[] = { 0, 4, 2, 1 }; /* The way Interlaced image should. */
static int const InterlacedJumps[] = { 8, 8, 4, 2 };    /* be read - offsets and jumps... */

static void gif2Image( ColorMapObject const &map,
                       SavedImage const     &frame,
                       int                   bgColor,
                       unsigned              width,
                       unsigned              height,
                       image_t              &image )
{
   int const transparent = transparentIndex( frame );
   image.allocate( width, height );

   //
   // anything the frame doesn't cover is background
   //
   for( unsigned y = 0 ; y < height ; y++ )
      for( unsigned x = 0 ; x < width ; x++ )
         setColor( image.pixel( x, y ), map, bgColor, transparent );

   unsigned const top  = frame.ImageDesc.Top ;
   unsigned const left = frame.ImageDesc.Left ;
   unsigned const rows = frame.ImageDesc.Height ;
   unsigned const cols = frame.ImageDesc.Width ;

   //
   // row-ordered rasters are one pass through every row
   //
   unsigned const numPasses = ( SLURPDEINTERLACES || ( 0 == frame.ImageDesc.Interlace ) ) ? 1 : 4 ;
   GifByteType const *raster = frame.RasterBits ;
   for( unsigned pass = 0 ; pass < numPasses ; pass++ )
   {
      unsigned const first = ( 1 == numPasses ) ? 0 : InterlacedOffset[pass];
      unsigned const step  = ( 1 == numPasses ) ? 1 : InterlacedJumps[pass];
      for( unsigned row = first ; row < rows ; row += step )
      {
         unsigned const screenY = top + row ;
         for( unsigned column = 0 ; column < cols ; column++, raster++ )
         {
            unsigned const screenX = left + column ;
            if( ( screenX < width ) && ( screenY < height ) )
               setColor( image.pixel( screenX, screenY ), map, *raster, transparent );
         } // for each column
      } // for each row in this pass
   }
}

bool imageGIF( void const    *inData,     // input
               unsigned long  inSize,     // input
               image_t       &image )     // output
{
   image.unload();

   gifSrc_t src ;
   src.data_    = (GifByteType const *)inData ;
   src.length_  = inSize ;
   src.numRead_ = 0 ;

   GifFileType *fGIF = GIFOPEN( &src, gifRead );
   if( fGIF )
   {
      if( GIF_OK == DGifSlurp( fGIF ) )
      {
         if( 1 <= fGIF->ImageCount )
         {
            SavedImage const *frame = fGIF->SavedImages ;
            ColorMapObject const *colorMap = frame->ImageDesc.ColorMap
                                             ? frame->ImageDesc.ColorMap
                                             : fGIF->SColorMap ;
            if( colorMap )
            {
               unsigned width  = fGIF->SWidth ;
               unsigned height = fGIF->SHeight ;
               if( ( 0 == width ) || ( 0 == height ) )
               {
                  width  = frame->ImageDesc.Left + frame->ImageDesc.Width ;
                  height = frame->ImageDesc.Top + frame->ImageDesc.Height ;
               }
               debugPrint( "GIF: %ux%u, %d frames\n", width, height, fGIF->ImageCount );
               if( ( 0 == width ) || ( 0 == height ) )
                  fprintf( stderr, "Empty GIF\n" );
               else if( MAXPIXELS/width < height )
                  fprintf( stderr, "unsupported image size %ux%u\n", width, height );
               else
                  gif2Image( *colorMap, *frame, fGIF->SBackGroundColor, width, height, image );
            }
            else
               fprintf( stderr, "Invalid color map\n" );
         }
         else
            fprintf( stderr, "No images\n" );
      }
      else
         fprintf( stderr, "Error decoding GIF\n" );
      GIFCLOSE( fGIF );
   }
   else
      fprintf( stderr, "Error reading GIF\n" );

   return image.isLoaded();
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
         image_t image ;
         if( imageGIF( fIn.getData(), fIn.getLength(), image ) )
            printf( "image: %u x %u pixels\n", image.width_, image.height_ );
         else
            fprintf( stderr, "Error converting image\n" );
      }
      else
         fprintf( stderr, "Error %s opening %s\n", fIn.getError(), argv[1] );
   }
   else
      fprintf( stderr, "Usage : imgGIF fileName\n" );

   return 0 ;
}

#endif
