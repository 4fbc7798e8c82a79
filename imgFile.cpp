/*
 * Module imgFile.cpp
 *
 * This module defines the imageFromFile() and imageFromMemory()
 * routines as declared in imgFile.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "imgFile.h"
#include "memFile.h"
#include "imgJPEG.h"
#include "imgPNG.h"
#include "imgGIF.h"
#include <string.h>
#include <stdio.h>

image_t::type_e imageType( void const   *data,
                           unsigned long length )
{
   unsigned char const *bytes = (unsigned char const *)data ;
   if( 4 > length )
      return image_t::unknown ;
   if( ( 0x89 == bytes[0] ) && ( 'P' == bytes[1] ) && ( 'N' == bytes[2] ) && ( 'G' == bytes[3] ) )
      return image_t::imgPNG ;
   if( ( 0xFF == bytes[0] ) && ( 0xD8 == bytes[1] ) && ( 0xFF == bytes[2] ) )
      return image_t::imgJPEG ;
   if( 0 == memcmp( bytes, "GIF8", 4 ) )
      return image_t::imgGIF ;
   return image_t::unknown ;
}

bool imageFromMemory( void const   *data,
                      unsigned long length,
                      image_t      &image )
{
   image.unload();
   switch( imageType( data, length ) )
   {
      case image_t::imgPNG :
         return imagePNG( data, length, image );
      case image_t::imgJPEG :
         return imageJPEG( data, length, image );
      case image_t::imgGIF :
         return imageGIF( data, length, image );
      default:
         fprintf( stderr, "Unknown image type\n" );
   }
   return false ;
}

bool imageFromFile( char const *fileName,
                    image_t    &image )
{
   image.unload();
   memFile_t fIn( fileName );
   if( fIn.worked() )
      return imageFromMemory( fIn.getData(), fIn.getLength(), image );

   fprintf( stderr, "Error %s opening %s\n", fIn.getError(), fileName );
   return false ;
}


#ifdef STANDALONE

int main( int argc, char const * const argv[] )
{
   if( 2 <= argc )
   {
      image_t image ;
      if( imageFromFile( argv[1], image ) )
         printf( "%s: %u x %u pixels\n", argv[1], image.width_, image.height_ );
      else
         fprintf( stderr, "Error loading %s\n", argv[1] );
   }
   else
      fprintf( stderr, "Usage: imgFile fileName\n" );
   return 0 ;
}
#endif
