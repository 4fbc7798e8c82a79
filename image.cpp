/*
 * Module image.cpp
 *
 * This module defines the methods of the image_t
 * class as declared in image.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "image.h"

image_t :: ~image_t( void )
{
   unload();
}

void image_t :: allocate( unsigned width, unsigned height )
{
   unload();
   pixData_ = new unsigned char [ (unsigned long)width*height*bytesPerPixel ];
   width_   = width ;
   height_  = height ;
}

void image_t :: unload( void )
{
   if( pixData_ )
      delete [] pixData_ ;
   pixData_ = 0 ;
   width_ = height_ = 0 ;
}

void image_t :: adopt( image_t &rhs )
{
   if( &rhs != this )
   {
      unload();
      pixData_ = rhs.pixData_ ;
      width_   = rhs.width_ ;
      height_  = rhs.height_ ;
      rhs.pixData_ = 0 ;
      rhs.width_ = rhs.height_ = 0 ;
   }
}

static char const *typeNames_[] = {
   "unknown"
 , "JPEG"
 , "PNG"
 , "GIF"
};

char const *image_t::typeName( type_e type )
{
   if( (unsigned)type > imgGIF )
      type = unknown ;
   return typeNames_[type];
}
