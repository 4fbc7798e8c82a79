#ifndef __DEBUGPRINT_H__
#define __DEBUGPRINT_H__ "$Id$"

/*
 * debugPrint.h
 *
 * This header file declares the debugPrint() routine,
 * which is used to print debug information if the DEBUGPRINT
 * macro is set, and the debugHex() routine, which dumps a
 * command buffer in hex under the same control.
 *
 * Define DEBUGPRINT before including this file in any
 * module that should be chatty. Everything else compiles
 * to nothing.
 *
 * Errors are not debug output. Report those to stderr
 * regardless of DEBUGPRINT.
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

#ifdef DEBUGPRINT
#include <stdio.h>
#include <stdarg.h>
#include "hexDump.h"

static inline int debugPrint( char const *fmt, ... )
{
   va_list ap;
   va_start( ap, fmt );
   int const rval = vfprintf( stderr, fmt, ap );
   va_end( ap );
   return rval ;
}

static inline void debugHex( char const *label, void const *data, unsigned long size )
{
   fprintf( stderr, "%s: %lu bytes\n", label, size );
   hexDumper_t dump( data, size );
   while( dump.nextLine() )
      fprintf( stderr, "%s\n", dump.getLine() );
}

#else

static inline int debugPrint( char const *, ... )
{
   return 0 ;
}

static inline void debugHex( char const *, void const *, unsigned long )
{
}

#endif

#endif

