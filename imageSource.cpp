/*
 * Module imageSource.cpp
 *
 * This module defines the methods of the urlImageSource_t
 * class as declared in imageSource.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "imageSource.h"
#include "imgFile.h"
#include "imgScale.h"
#include "memFile.h"
#include "curlGet.h"
#include "macros.h"
#include <string.h>
#include <strings.h>

#include "debugPrint.h"

static char const filePrefix[] = {
   "file://"
};

static char const *const remotePrefixes[] = {
   "http://"
,  "https://"
,  "ftp://"
};

bool urlImageSource_t :: isRemote( char const *url )
{
   for( unsigned i = 0 ; i < dim( remotePrefixes ); i++ )
   {
      if( 0 == strncasecmp( url, remotePrefixes[i], strlen( remotePrefixes[i] ) ) )
         return true ;
   }
   return false ;
}

bool urlImageSource_t :: load( char const  *url,
                               image_t     &image,
                               std::string &errorMsg )
{
   image.unload();
   errorMsg.clear();

   if( ( 0 == url ) || ( '\0' == *url ) )
   {
      errorMsg = "no image URL" ;
      return false ;
   }

   if( isRemote( url ) )
   {
      std::string data ;
      std::string curlError ;
      if( !curlGet( url, data, curlError, timeoutSecs_ ) )
      {
         errorMsg = std::string( url ) + ": " + curlError ;
         return false ;
      }
      if( !imageFromMemory( data.data(), data.size(), image ) )
      {
         errorMsg = std::string( url ) + ": not a PNG, JPEG or GIF image" ;
         return false ;
      }
   }
   else
   {
      char const *path = url ;
      if( 0 == strncasecmp( url, filePrefix, sizeof( filePrefix )-1 ) )
         path += sizeof( filePrefix )-1 ;

      memFile_t fIn( path );
      if( !fIn.worked() )
      {
         errorMsg = std::string( path ) + ": " + fIn.getError();
         return false ;
      }
      if( !imageFromMemory( fIn.getData(), fIn.getLength(), image ) )
      {
         errorMsg = std::string( path ) + ": not a PNG, JPEG or GIF image" ;
         return false ;
      }
   }

   debugPrint( "%s: %u x %u pixels\n", url, image.width_, image.height_ );
   return true ;
}

bool urlImageSource_t :: resize( image_t const &src,
                                 unsigned       width,
                                 unsigned       height,
                                 bool           nearest,
                                 image_t       &dest )
{
   if( ( 0 == width ) || ( 0 == height ) || !src.isLoaded() )
      return false ;

   if( nearest )
      scaleNearest( src, width, height, dest );
   else
      scaleArea( src, width, height, dest );
   return true ;
}

