#ifndef __MACROS_H__
#define __MACROS_H__ "$Id$"

/*
 * macros.h
 *
 * This header file declares utility stuff noone should
 * be without.
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

//
// be careful not to use this on dynamically allocated arrays.
//
#define dim( __arr ) ( sizeof( __arr )/sizeof( __arr[0] ) )

//
// intel (little-endian) order, independent of host order
//
#define intelLowByte( __w )  ((unsigned char)( (__w) & 0xFF ))
#define intelHighByte( __w ) ((unsigned char)( ( (__w) >> 8 ) & 0xFF ))

#endif

