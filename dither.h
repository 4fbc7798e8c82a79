#ifndef __DITHER_H__
#define __DITHER_H__ "$Id$"

/*
 * dither.h
 *
 * This header file declares the dither_t class,
 * which is used to reduce an RGBA image to the
 * print/no-print dots of a thermal printer.
 *
 * Every pixel is first classified from its source
 * value:
 *
 *    alpha below alphaCutoff    - no-print (paper)
 *    luma below darkCutoff      - no-print
 *    luma above lightCutoff     - print
 *    anything else              - mid-range
 *
 * The dark and light rules are inverted from what you'd
 * expect. Logos are usually drawn on a black or transparent
 * canvas, and printing the canvas gives a solid black block.
 *
 * Mid-range pixels are then either thresholded (print
 * if luma is below threshold) or run through a Floyd-
 * Steinberg dither:
 *
 * 	    X      7/16
 *       3/16   5/16  1/16
 *
 * in which quantization error only flows into neighbors
 * that are themselves mid-range. Pixels with a fixed
 * classification neither give nor take error.
 *
 * Luma is ITU-R 601 (0.299R + 0.587G + 0.114B) unless
 * fastLuma is set, in which case it's (R+G+B)/3.
 *
 * Bits are stored one row at a time, each row starting
 * on a byte boundary. Bit 7 of the first byte is the
 * left-most dot, and a set bit means print. Padding
 * bits at the end of each row are clear.
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

#ifndef __IMAGE_H__
#include "image.h"
#endif

struct ditherLevels_t {
   unsigned alphaCutoff ;
   unsigned darkCutoff ;
   unsigned lightCutoff ;
   unsigned threshold ;
   bool     fastLuma ;

   ditherLevels_t( void )
      : alphaCutoff( 128 )
      , darkCutoff( 32 )
      , lightCutoff( 223 )
      , threshold( 128 )
      , fastLuma( false ){}
};

class dither_t {
public:
   enum pixelClass_e {
      noPrint,
      print,
      midRange
   };

   dither_t( image_t const        &image,
             ditherLevels_t const &levels,
             bool                  diffuse );
   ~dither_t( void )
   {
      if( bits_ )
         delete [] bits_ ;
   }

   inline unsigned getWidth( void ) const { return width_ ; }
   inline unsigned getHeight( void ) const { return height_ ; }
   inline unsigned bytesPerRow( void ) const { return bytesPerRow_ ; }

   inline bool prints( unsigned x, unsigned y ) const ;
   unsigned char const *getBits( void ) const { return bits_ ; }

   //
   // luma in thousandths (0..255000) so the cutoffs
   // are exact comparisons with no rounding
   //
   static unsigned long luma( unsigned char const *rgba, bool fastLuma );

   static pixelClass_e classify( unsigned char const  *rgba,
                                 ditherLevels_t const &levels,
                                 unsigned long        &luma );

private:
   dither_t( dither_t const & ); // no copies
   dither_t &operator=( dither_t const & );

   unsigned const       width_ ;
   unsigned const       height_ ;
   unsigned const       bytesPerRow_ ;
   unsigned char *const bits_ ;
};


bool dither_t :: prints( unsigned x, unsigned y ) const
{
   if( ( x < width_ ) && ( y < height_ ) )
      return 0 != ( bits_[(y*bytesPerRow_)+(x/8)] & ( 0x80 >> (x&7) ) );
   return false ;
}

#endif

