/*
 * Module bitPack.cpp
 *
 * This module defines the packRow() and putLE16()
 * routines as declared in bitPack.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "bitPack.h"
#include "macros.h"

void packRow( unsigned char const *dots,
              unsigned             count,
              unsigned char       *out )
{
   unsigned char mask = 0x80 ;
   unsigned char outVal = 0 ;
   for( unsigned i = 0 ; i < count ; i++ )
   {
      if( dots[i] )
         outVal |= mask ;
      mask >>= 1 ;
      if( 0 == mask ){
         *out++ = outVal ;
         outVal = 0 ;
         mask = 0x80 ;
      }
   }
   if( 0x80 != mask )
      *out = outVal ;
}

void putLE16( unsigned       value,
              unsigned char *out )
{
   out[0] = intelLowByte( value );
   out[1] = intelHighByte( value );
}

