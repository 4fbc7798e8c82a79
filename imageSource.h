#ifndef __IMAGESOURCE_H__
#define __IMAGESOURCE_H__ "$Id$"

/*
 * imageSource.h
 *
 * This header file declares the imageSource_t interface,
 * which the raster encoder uses to get at pixels:
 *
 *    load( url )                  - fetch and decode an image
 *    resize( src, w, h, nearest ) - produce a scaled copy
 *
 * and urlImageSource_t, the implementation used by default:
 *
 *    http://, https:// and ftp:// URLs are fetched with curl.
 *    file:// URLs and plain paths are mapped with memFile_t.
 *
 *    PNG, JPEG and GIF are decoded (see imgFile.h).
 *
 *    Resizing uses scaleArea() or scaleNearest() (see imgScale.h).
 *
 * Substitute another implementation to get pixels from somewhere
 * else (a cache, a test fixture...) without touching the encoder.
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

#include <string>

#ifndef __IMAGE_H__
#include "image.h"
#endif

class imageSource_t {
public:
   virtual ~imageSource_t( void ){}

   //
   // returns false and fills in errorMsg if the image can't
   // be retrieved or decoded
   //
   virtual bool load( char const  *url,
                      image_t     &image,
                      std::string &errorMsg ) = 0 ;

   virtual bool resize( image_t const &src,
                        unsigned       width,
                        unsigned       height,
                        bool           nearest,
                        image_t       &dest ) = 0 ;
};

class urlImageSource_t : public imageSource_t {
public:
   urlImageSource_t( long timeoutSecs = 30 )
      : timeoutSecs_( timeoutSecs ){}
   virtual ~urlImageSource_t( void ){}

   virtual bool load( char const  *url,
                      image_t     &image,
                      std::string &errorMsg );

   virtual bool resize( image_t const &src,
                        unsigned       width,
                        unsigned       height,
                        bool           nearest,
                        image_t       &dest );

   //
   // true for URLs that need a network fetch
   //
   static bool isRemote( char const *url );

private:
   long const timeoutSecs_ ;
};

#endif

