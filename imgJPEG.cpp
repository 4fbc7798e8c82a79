/*
 * Module imgJPEG.cpp
 *
 * This module defines the imageJPEG() routine as
 * declared in imgJPEG.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "imgJPEG.h"
#include <stdio.h>
#include <string.h>
#include <setjmp.h>

extern "C" {
#include <jpeglib.h>
};

#define MAXPIXELS (16UL<<20)

//
// used differently than pngData_t.
//
// libjpeg keeps track of the ptr and length, so this
// structure is kept constant and the internals of
// jpeg_source_mgr are changed to point somewhere within.
//
typedef struct {
   JOCTET const *data_ ;
   size_t        length_ ;
} jpegSrc_t ;

//
// libjpeg's default error_exit() calls exit(). We'd rather
// report a bad logo and keep printing the receipt.
//
typedef struct {
   struct jpeg_error_mgr pub_ ;
   jmp_buf               jmp_ ;
} jpegErr_t ;

static JOCTET const fakeEOI[] = {
   0xFF, JPEG_EOI
};

static void jpg_init_source( j_decompress_ptr cinfo )
{
}

static boolean jpg_fill_input_buffer( j_decompress_ptr cinfo )
{
   //
   // everything was handed over up front, so running out
   // means a truncated file. Insert an EOI so the decoder
   // finishes with whatever it has.
   //
   cinfo->err->emit_message( (j_common_ptr)cinfo, -1 );
   cinfo->src->next_input_byte = fakeEOI ;
   cinfo->src->bytes_in_buffer = sizeof( fakeEOI );
   return TRUE ;
}

static void jpg_skip_input_data( j_decompress_ptr cinfo, long num_bytes )
{
   if( 0 < num_bytes )
   {
      if( (size_t)num_bytes > cinfo->src->bytes_in_buffer )
      {
         jpg_fill_input_buffer( cinfo );
      }
      else
      {
         cinfo->src->next_input_byte += num_bytes ;
         cinfo->src->bytes_in_buffer -= num_bytes ;
      }
   }
}

static void jpg_term_source( j_decompress_ptr cinfo )
{
   // nothing to do
}

static void jpg_error_exit( j_common_ptr cinfo )
{
   char msg[JMSG_LENGTH_MAX];
   (*cinfo->err->format_message)( cinfo, msg );
   fprintf( stderr, "JPEG error: %s\n", msg );
   jpegErr_t *err = (jpegErr_t *)cinfo->err ;
   longjmp( err->jmp_, 1 );
}

bool imageJPEG( void const    *inData,     // input
                unsigned long  inSize,     // input
                image_t       &image )     // output
{
   image.unload();

   jpegSrc_t jpgSrc ;
   jpgSrc.data_   = (JOCTET const *)inData ;
   jpgSrc.length_ = inSize ;

   struct jpeg_decompress_struct cinfo;
   jpegErr_t jerr ;
   cinfo.err = jpeg_std_error( &jerr.pub_ );
   jerr.pub_.error_exit = jpg_error_exit ;

   jpeg_create_decompress(&cinfo);

   unsigned char *volatile pixMap = 0 ;
   volatile bool worked = false ;

   if( 0 == setjmp( jerr.jmp_ ) )
   {
      cinfo.client_data = &jpgSrc ;

      jpeg_source_mgr srcMgr ;
      memset( &srcMgr, 0, sizeof( srcMgr ) );
      srcMgr.next_input_byte  = jpgSrc.data_ ;     /* => next byte to read from buffer */
      srcMgr.bytes_in_buffer  = jpgSrc.length_ ;   /* # of bytes remaining in buffer */

      srcMgr.init_source         = jpg_init_source ;
      srcMgr.fill_input_buffer   = jpg_fill_input_buffer ;
      srcMgr.skip_input_data     = jpg_skip_input_data ;
      srcMgr.resync_to_restart   = jpeg_resync_to_restart ;
      srcMgr.term_source         = jpg_term_source ;
      cinfo.src = &srcMgr ;

      jpeg_read_header(&cinfo, TRUE);
      cinfo.out_color_space = JCS_RGB ;

      jpeg_start_decompress(&cinfo);

      unsigned const width  = cinfo.output_width ;
      unsigned const height = cinfo.output_height ;
      if( ( 0 == width ) || ( 0 == height ) || ( MAXPIXELS/width < height ) )
      {
         fprintf( stderr, "JPEG: unsupported image size %ux%u\n", width, height );
         jpeg_destroy_decompress(&cinfo);
         return false ;
      }

      int const row_stride = width * cinfo.output_components;
      JSAMPARRAY buffer = (*cinfo.mem->alloc_sarray)( (j_common_ptr)&cinfo,
                                                      JPOOL_IMAGE,
                                                      row_stride, 1);

      pixMap = new unsigned char [ width*height*image_t::bytesPerPixel ];

      // read the scanlines
      unsigned char *nextPix = pixMap ;
      while( cinfo.output_scanline < height )
      {
         jpeg_read_scanlines( &cinfo, buffer, 1 );
         unsigned char const *nextIn = buffer[0];

         for( unsigned column = 0; column < width; ++column )
         {
            if( cinfo.output_components == 1 )
            {
               nextPix[0] = nextPix[1] = nextPix[2] = *nextIn++ ;
            }
            else
            {
               nextPix[0] = *nextIn++ ;
               nextPix[1] = *nextIn++ ;
               nextPix[2] = *nextIn++ ;
            }
            nextPix[3] = 0xFF ;
            nextPix += image_t::bytesPerPixel ;
         }
      }

      jpeg_finish_decompress(&cinfo);

      image.pixData_ = pixMap ;
      image.width_   = width ;
      image.height_  = height ;
      worked = true ;
   }
   else
   {
      delete [] pixMap ;
   }

   jpeg_destroy_decompress(&cinfo);

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
         if( imageJPEG( fIn.getData(), fIn.getLength(), image ) )
            printf( "image: %u x %u pixels\n", image.width_, image.height_ );
         else
            fprintf( stderr, "Error converting image\n" );
      }
      else
         fprintf( stderr, "Error %s opening %s\n", fIn.getError(), argv[1] );
   }
   else
      fprintf( stderr, "Usage : imgJPEG fileName\n" );

   return 0 ;
}

#endif
