/*
 * Module imgPNG.cpp
 *
 * This module defines the imagePNG() routine as declared
 * in imgPNG.h.
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "imgPNG.h"
#include <png.h>
#include <string.h>
#include <stdio.h>

//
// anything bigger than this isn't a receipt logo
//
#define MAXPIXELS (16UL<<20)

typedef struct {
   png_bytep   data_ ;
   size_t      length_ ;
} pngData_t ;

static void pngRead( png_structp png,
                     png_bytep   data,
                     png_size_t  len )
{
   pngData_t *pData = (pngData_t *)png_get_io_ptr( png );
   if( len <= pData->length_ )
   {
      memcpy( data, pData->data_, len );
      pData->data_ += len ;
      pData->length_ -= len ;
   }
   else
      png_error( png, "short read");
}

bool imagePNG( void const    *inData,     // input
               unsigned long  inSize,     // input
               image_t       &image )     // output
{
   image.unload();

   png_bytep pngData = (png_bytep)inData ;
   if( 8 >= inSize )
   {
      fprintf( stderr, "PNG too short!\n" );
      return false ;
   }

   if( 0 != png_sig_cmp( pngData, 0, 8 ) )
   {
      fprintf( stderr, "Not a PNG file\n" );
      return false ;
   }

   png_structp png_ptr = png_create_read_struct( PNG_LIBPNG_VER_STRING, 0, 0, 0 );
   if( 0 == png_ptr )
   {
      fprintf( stderr, "Error allocating PNG reader\n" );
      return false ;
   }

   png_infop info_ptr = png_create_info_struct(png_ptr);
   if( 0 == info_ptr )
   {
      png_destroy_read_struct( &png_ptr, 0, 0 );
      fprintf( stderr, "Error allocating PNG info\n" );
      return false ;
   }

   //
   // these have to survive a longjmp() out of libpng
   //
   unsigned char *volatile pixMap = 0 ;
   png_bytep     *volatile rowPointers = 0 ;
   volatile bool worked = false ;

   if( 0 == setjmp( png_jmpbuf( png_ptr ) ) )
   {
      pngData_t pngFile ;
      pngFile.data_   = pngData ;
      pngFile.length_ = inSize ;

      png_set_read_fn( png_ptr, &pngFile, pngRead );

      png_read_info(png_ptr, info_ptr);

      int interlace_type, compression_type, filter_type;
      png_uint_32 width, height;
      int bit_depth, color_type;

      png_get_IHDR( png_ptr, info_ptr, &width, &height,
                    &bit_depth, &color_type, &interlace_type,
                    &compression_type, &filter_type);

      if( ( 0 == width ) || ( 0 == height ) || ( MAXPIXELS/width < height ) )
         png_error( png_ptr, "unsupported image size" );

      bool const hasTRNS = ( 0 != png_get_valid( png_ptr, info_ptr, PNG_INFO_tRNS ) );

      //
      // palette -> RGB, grey < 8 bits -> 8 bits, tRNS -> alpha
      //
      png_set_expand( png_ptr );
      if( 16 == bit_depth )
         png_set_strip_16( png_ptr );
      if( 0 == ( color_type & PNG_COLOR_MASK_COLOR ) )
         png_set_gray_to_rgb( png_ptr );
      if( ( 0 == ( color_type & PNG_COLOR_MASK_ALPHA ) ) && !hasTRNS )
         png_set_filler( png_ptr, 0xff, PNG_FILLER_AFTER );
      png_set_interlace_handling( png_ptr );

      png_read_update_info(png_ptr, info_ptr);

      unsigned const rowBytes = png_get_rowbytes( png_ptr, info_ptr );
      if( rowBytes != width*image_t::bytesPerPixel )
         png_error( png_ptr, "unexpected row size" );

      pixMap = new unsigned char [ width*height*image_t::bytesPerPixel ];
      rowPointers = new png_bytep[height];
      for( unsigned row = 0; row < height; row++ )
         rowPointers[row] = pixMap + row*rowBytes ;

      png_read_image( png_ptr, rowPointers );
      png_read_end( png_ptr, 0 );

      image.pixData_ = pixMap ;
      image.width_   = width ;
      image.height_  = height ;
      worked = true ;
   }
   else
      fprintf( stderr, "Internal PNG error\n" );

   png_destroy_read_struct( &png_ptr, &info_ptr, 0 );

   delete [] rowPointers ;
   if( !worked )
      delete [] pixMap ;

   return worked ;
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
         printf( "%lu bytes read at address %p\n", fIn.getLength(), fIn.getData() );
         image_t image ;
         if( imagePNG( fIn.getData(), fIn.getLength(), image ) )
         {
            printf( "image: %u x %u pixels\n", image.width_, image.height_ );
            unsigned transparent = 0 ;
            for( unsigned y = 0 ; y < image.height_ ; y++ )
               for( unsigned x = 0 ; x < image.width_ ; x++ )
                  if( 128 > image.pixel( x, y )[3] )
                     transparent++ ;
            printf( "%u transparent pixels\n", transparent );
         }
         else
            fprintf( stderr, "Error converting image\n" );
      }
      else
         fprintf( stderr, "Error %s opening %s\n", fIn.getError(), argv[1] );
   }
   else
      fprintf( stderr, "Usage : imgPNG fileName\n" );

   return 0 ;
}

#endif
