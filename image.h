#ifndef __IMAGE_H__
#define __IMAGE_H__ "$Id$"

/*
 * image.h
 *
 * This header file declares the image_t class, which is
 * a really simple structure used to keep track of the
 * book-keeping and allocation of decoded image data.
 *
 * Pixels are always 8-bit RGBA, four bytes per pixel,
 * row-major with no padding between rows. Decoders
 * without an alpha channel fill in 0xFF.
 *
 * All of the real work is done by the imgXXX functions
 * (imgGIF, imgPNG... ).
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

class image_t {
public:
   enum type_e {
      unknown = 0,
      imgJPEG,
      imgPNG,
      imgGIF
   };

   enum {
      bytesPerPixel = 4
   };

   image_t( void )
      : pixData_( 0 )
      , width_( 0 )
      , height_( 0 ){}

   image_t( unsigned char *pixData,       // should be new []'d, image will take ownership
            unsigned       width,
            unsigned       height )
      : pixData_( pixData )
      , width_( width )
      , height_( height ){}

   ~image_t( void );

   // allocates (uninitialized) storage for width x height pixels
   void allocate( unsigned width, unsigned height );

   // use this before re-use
   void unload( void );

   // take over the pixels of rhs, leaving it empty
   void adopt( image_t &rhs );

   static char const *typeName( type_e type );

   inline bool isLoaded( void ) const { return 0 != pixData_ ; }

   inline unsigned char const *pixel( unsigned x, unsigned y ) const
      { return pixData_ + ( ( (unsigned long)y*width_ ) + x ) * bytesPerPixel ; }
   inline unsigned char *pixel( unsigned x, unsigned y )
      { return pixData_ + ( ( (unsigned long)y*width_ ) + x ) * bytesPerPixel ; }

   unsigned char *pixData_ ;
   unsigned       width_ ;
   unsigned       height_ ;

private:
   image_t( image_t const & ); // no copies
   image_t &operator=( image_t const & );
};

#endif

