#ifndef __RASTERENCODER_H__
#define __RASTERENCODER_H__ "$Id$"

/*
 * rasterEncoder.h
 *
 * This header file declares the rasterEncoder_t class,
 * which turns a logo image into an ESC/POS raster bit
 * image command:
 *
 *    <GS>v0 0 xL xH yL yH d1...dk
 *
 * where x is the width in bytes and y the height in dots.
 *
 * The image is first scaled to fit the paper (never up),
 * then reduced to dots in one of three modes:
 *
 *    threshold   - area scaled, mid-range luma below level
 *                  prints
 *    dithered    - area scaled, Floyd-Steinberg on mid-range
 *    fast        - nearest-neighbor scaled, every lineSkip'th
 *                  row, (R+G+B)/3 luma against level. Meant
 *                  for slow links to the printer.
 *
 * See dither.h for the classification rules shared by all
 * three.
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

#include <string>
#include <vector>

#ifndef __IMAGESOURCE_H__
#include "imageSource.h"
#endif

struct rasterConfig_t {
   unsigned maxWidthDots ;       // threshold and dithered modes
   unsigned fastMaxWidthDots ;   // fast mode
   unsigned threshold ;
   unsigned lineSkip ;
   unsigned alphaCutoff ;
   unsigned darkCutoff ;
   unsigned lightCutoff ;

   rasterConfig_t( void )
      : maxWidthDots( 384 )
      , fastMaxWidthDots( 192 )
      , threshold( 128 )
      , lineSkip( 2 )
      , alphaCutoff( 128 )
      , darkCutoff( 32 )
      , lightCutoff( 223 ){}
};

struct rasterMode_t {
   enum type_e {
      threshold,
      dithered,
      fast
   };

   type_e   type ;
   unsigned level ;      // threshold and fast, 0 for configured
   unsigned lineSkip ;   // fast only, 0 for configured

   rasterMode_t( type_e t = dithered, unsigned l = 0, unsigned skip = 0 )
      : type( t ), level( l ), lineSkip( skip ){}

   static char const *typeName( type_e t );

   //
   // "threshold", "dithered" or "fast". Returns false on
   // anything else.
   //
   static bool parse( char const *name, type_e &t );
};

//
// The 1-bit image as sent to the printer. A set bit prints.
//
struct monoBitmap_t {
   unsigned                   byteWidth ;
   unsigned                   dotHeight ;
   std::vector<unsigned char> rows ;

   monoBitmap_t( void ) : byteWidth( 0 ), dotHeight( 0 ){}

   inline bool prints( unsigned x, unsigned y ) const
   {
      return 0 != ( rows[(y*byteWidth)+(x/8)] & ( 0x80 >> (x&7) ) );
   }
};

//
// appends <GS>v0 framing and the rows of bitmap to out
//
void rasterCommand( monoBitmap_t const         &bitmap,
                    std::vector<unsigned char> &out );

class rasterEncoder_t {
public:
   rasterEncoder_t( imageSource_t        &source,
                    rasterConfig_t const &config = rasterConfig_t() );

   //
   // maxWidthDots of zero uses the configured width for the mode
   //
   bool toBitmap( image_t const      &image,
                  unsigned            maxWidthDots,
                  rasterMode_t const &mode,
                  monoBitmap_t       &bitmap,
                  std::string        &errorMsg );

   // append the raster command for image to out
   bool encode( image_t const              &image,
                unsigned                    maxWidthDots,
                rasterMode_t const         &mode,
                std::vector<unsigned char> &out,
                std::string                &errorMsg );

   // load from the image source, then encode
   bool encodeURL( char const                 *url,
                   unsigned                    maxWidthDots,
                   rasterMode_t const         &mode,
                   std::vector<unsigned char> &out,
                   std::string                &errorMsg );

   rasterConfig_t const &config( void ) const { return config_ ; }

private:
   rasterEncoder_t( rasterEncoder_t const & ); // no copies
   rasterEncoder_t &operator=( rasterEncoder_t const & );

   imageSource_t &source_ ;
   rasterConfig_t config_ ;
};

#endif

