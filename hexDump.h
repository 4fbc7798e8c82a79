#ifndef __HEXDUMP_H__
#define __HEXDUMP_H__ "$Id$"

/*
 * hexDump.h
 *
 * This header file declares the hexDumper_t
 * class, which is used for displaying hunks of
 * memory for examination, and the hexString()
 * routine, which renders a printer command stream
 * as a single line of upper-case hex pairs:
 *
 *    1B 40 1B 61 01
 *
 * Neither of these are part of the output sent to
 * a printer. They're diagnostic aids only.
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

#include <string>

class hexDumper_t {
public:
   hexDumper_t( void const   *data,
                unsigned long size,
                unsigned long addr = 0 )   // address shown on first line
      : data_( (unsigned char const *)data ),
        bytesLeft_( size ),
        addr_( addr ){ lineBuf_[0] = '\0' ; }

   //
   // returns true and fills in line if something left
   // use getLine() to get the data
   //
   bool nextLine( void );

   char const *getLine( void ) const { return lineBuf_ ; }

private:
   unsigned char const *data_ ;
   unsigned long        bytesLeft_ ;
   unsigned long        addr_ ;
   char                 lineBuf_[ 81 ];
};

//
// "1B 40 0A" form. Empty string for zero-length input.
//
std::string hexString( void const   *data,
                       unsigned long size );

#endif

