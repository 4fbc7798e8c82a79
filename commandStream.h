#ifndef __COMMANDSTREAM_H__
#define __COMMANDSTREAM_H__ "$Id$"

/*
 * commandStream.h
 *
 * This header file declares the commandStream_t class,
 * which holds the pieces of a print job (printer commands
 * and text) in the order they were added, and turns them
 * into a single buffer.
 *
 * flatten() makes two passes over the segments: one to
 * size the output and one to copy into it. If the passes
 * disagree, the job is discarded and nothing is returned.
 *
 * A stream can only be flattened once.
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

class commandStream_t {
public:
   enum segmentType_e {
      binary,
      text
   };

   commandStream_t( void );

   // printer commands
   void add( void const *data, unsigned long length );
   void add( std::vector<unsigned char> const &data );

   // text
   void add( std::string const &s );
   void add( char const *s );

   // copies the segments of rhs onto the end
   void append( commandStream_t const &rhs );

   inline unsigned segmentCount( void ) const { return segments_.size(); }
   unsigned long segmentLength( unsigned idx ) const ;
   segmentType_e segmentType( unsigned idx ) const ;

   // sum of segment lengths
   unsigned long totalLength( void ) const ;

   bool flatten( std::vector<unsigned char> &out );
   inline bool flattened( void ) const { return flattened_ ; }

private:
   struct segment_t {
      segmentType_e        type ;
      std::vector<unsigned char> data ;
   };

   void addSegment( segmentType_e type, void const *data, unsigned long length );

   std::vector<segment_t> segments_ ;
   bool                   flattened_ ;
};

#endif

