#ifndef __BITPACK_H__
#define __BITPACK_H__ "$Id$"

/*
 * bitPack.h
 *
 * This header file declares the routines used to lay out
 * the bytes of a printer raster image:
 *
 *    rasterByteWidth()  - bytes needed for a row of dots
 *    packRow()          - one byte per dot in, eight dots
 *                         per byte out, MSB first
 *    putLE16()          - two byte little-endian value
 *
 * These are the bits the printer is fussy about, so they're
 * kept apart from the image code.
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

inline unsigned rasterByteWidth( unsigned dots )
{
   return ( dots + 7 ) / 8 ;
}

//
// dots[i] non-zero means print. Writes rasterByteWidth(count)
// bytes to out, with any padding bits in the last byte clear.
//
void packRow( unsigned char const *dots,
              unsigned             count,
              unsigned char       *out );

//
// stores the low 16 bits of value, low byte first
//
void putLE16( unsigned       value,
              unsigned char *out );

#endif

