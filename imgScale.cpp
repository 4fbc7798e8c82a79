/*
 * Module imgScale.cpp
 *
 * This module defines the image scaling routines
 * as declared in imgScale.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "imgScale.h"

//
// source range [first,last) covered by output position i of n
//
static inline void sourceSpan( unsigned  i,
                               unsigned  n,
                               unsigned  srcSize,
                               unsigned &first,
                               unsigned &last )
{
   first = (unsigned)( ( (unsigned long long)i * srcSize ) / n );
   last  = (unsigned)( ( (unsigned long long)( i + 1 ) * srcSize ) / n );
   if( last <= first )
      last = first + 1 ;
   if( last > srcSize )
   {
      last = srcSize ;
      if( first >= last )
         first = last - 1 ;
   }
}

void scaleArea( image_t const &src,
                unsigned       width,
                unsigned       height,
                image_t       &dest )
{
   dest.allocate( width, height );
   if( ( 0 == width ) || ( 0 == height ) || ( 0 == src.width_ ) || ( 0 == src.height_ ) )
      return ;

   unsigned char *nextOut = dest.pixData_ ;
   for( unsigned y = 0 ; y < height ; y++ )
   {
      unsigned top, bottom ;
      sourceSpan( y, height, src.height_, top, bottom );
      for( unsigned x = 0 ; x < width ; x++ )
      {
         unsigned left, right ;
         sourceSpan( x, width, src.width_, left, right );

         unsigned long sums[3] = { 0, 0, 0 };
         unsigned long alphaSum = 0 ;
         unsigned long count = 0 ;
         for( unsigned sy = top ; sy < bottom ; sy++ )
         {
            unsigned char const *pix = src.pixel( left, sy );
            for( unsigned sx = left ; sx < right ; sx++, pix += image_t::bytesPerPixel )
            {
               unsigned const alpha = pix[3];
               sums[0] += pix[0]*alpha ;
               sums[1] += pix[1]*alpha ;
               sums[2] += pix[2]*alpha ;
               alphaSum += alpha ;
               count++ ;
            }
         }

         if( 0 != alphaSum )
         {
            nextOut[0] = (unsigned char)( sums[0] / alphaSum );
            nextOut[1] = (unsigned char)( sums[1] / alphaSum );
            nextOut[2] = (unsigned char)( sums[2] / alphaSum );
         }
         else
            nextOut[0] = nextOut[1] = nextOut[2] = 0xFF ;
         nextOut[3] = (unsigned char)( alphaSum / count );
         nextOut += image_t::bytesPerPixel ;
      }
   }
}

void scaleNearest( image_t const &src,
                   unsigned       width,
                   unsigned       height,
                   image_t       &dest )
{
   dest.allocate( width, height );
   if( ( 0 == width ) || ( 0 == height ) || ( 0 == src.width_ ) || ( 0 == src.height_ ) )
      return ;

   unsigned char *nextOut = dest.pixData_ ;
   for( unsigned y = 0 ; y < height ; y++ )
   {
      unsigned const sy = (unsigned)( ( (unsigned long long)y * src.height_ ) / height );
      for( unsigned x = 0 ; x < width ; x++ )
      {
         unsigned const sx = (unsigned)( ( (unsigned long long)x * src.width_ ) / width );
         unsigned char const *pix = src.pixel( sx, sy );
         nextOut[0] = pix[0];
         nextOut[1] = pix[1];
         nextOut[2] = pix[2];
         nextOut[3] = pix[3];
         nextOut += image_t::bytesPerPixel ;
      }
   }
}

void scaledSize( unsigned  srcWidth,
                 unsigned  srcHeight,
                 unsigned  maxWidth,
                 unsigned &width,
                 unsigned &height )
{
   if( ( 0 == srcWidth ) || ( 0 == srcHeight ) || ( 0 == maxWidth ) )
   {
      width = height = 0 ;
      return ;
   }

   width  = ( srcWidth < maxWidth ) ? srcWidth : maxWidth ;
   height = (unsigned)( ( (unsigned long long)width * srcHeight ) / srcWidth );
   if( 0 == height )
      height = 1 ;
}

