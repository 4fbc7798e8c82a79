/*
 * Module commandStream.cpp
 *
 * This module defines the methods of the commandStream_t
 * class as declared in commandStream.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "commandStream.h"
#include <string.h>
#include <stdio.h>

#include "debugPrint.h"

commandStream_t :: commandStream_t( void )
   : flattened_( false )
{
}

void commandStream_t :: addSegment( segmentType_e type,
                                    void const   *data,
                                    unsigned long length )
{
   segments_.push_back( segment_t() );
   segment_t &seg = segments_.back();
   seg.type = type ;
   if( 0 < length )
      seg.data.assign( (unsigned char const *)data, (unsigned char const *)data + length );
}

void commandStream_t :: add( void const *data, unsigned long length )
{
   addSegment( binary, data, length );
}

void commandStream_t :: add( std::vector<unsigned char> const &data )
{
   addSegment( binary, data.empty() ? 0 : &data[0], data.size() );
}

void commandStream_t :: add( std::string const &s )
{
   addSegment( text, s.data(), s.size() );
}

void commandStream_t :: add( char const *s )
{
   addSegment( text, s, strlen( s ) );
}

void commandStream_t :: append( commandStream_t const &rhs )
{
   segments_.insert( segments_.end(), rhs.segments_.begin(), rhs.segments_.end() );
}

unsigned long commandStream_t :: segmentLength( unsigned idx ) const
{
   if( idx < segments_.size() )
      return segments_[idx].data.size();
   return 0 ;
}

commandStream_t::segmentType_e commandStream_t :: segmentType( unsigned idx ) const
{
   if( idx < segments_.size() )
      return segments_[idx].type ;
   return binary ;
}

unsigned long commandStream_t :: totalLength( void ) const
{
   unsigned long total = 0 ;
   for( unsigned i = 0 ; i < segments_.size(); i++ )
      total += segments_[i].data.size();
   return total ;
}

bool commandStream_t :: flatten( std::vector<unsigned char> &out )
{
   out.clear();
   if( flattened_ )
   {
      fprintf( stderr, "commandStream: already flattened\n" );
      return false ;
   }
   flattened_ = true ;

   unsigned long const total = totalLength();
   std::vector<unsigned char> buf( total );

   unsigned long offset = 0 ;
   for( unsigned i = 0 ; i < segments_.size(); i++ )
   {
      std::vector<unsigned char> const &data = segments_[i].data ;
      if( offset + data.size() > total )
      {
         fprintf( stderr, "commandStream: internal error: segment %u overruns %lu bytes\n", i, total );
         return false ;
      }
      if( !data.empty() )
         memcpy( &buf[offset], &data[0], data.size() );
      offset += data.size();
   }

   if( offset != total )
   {
      fprintf( stderr, "commandStream: internal error: copied %lu of %lu bytes\n", offset, total );
      return false ;
   }

   debugPrint( "commandStream: %u segments, %lu bytes\n", (unsigned)segments_.size(), total );
   out.swap( buf );
   return true ;
}

