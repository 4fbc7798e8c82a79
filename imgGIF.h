#ifndef __IMGGIF_H__
#define __IMGGIF_H__ "$Id$"

/*
 * imgGIF.h
 *
 * This header file declares the imageGIF() routine,
 * which tries to convert a hunk of memory into an RGBA
 * pixmap (see image.h) by translating GIF.
 *
 * Only the first frame is used. The transparent color
 * index (from the graphics control extension) maps to
 * alpha 0, everything else to 0xFF.
 *
 * Decode errors are reported on stderr and result in
 * a false return with the image left unloaded.
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

#ifndef __IMAGE_H__
#include "image.h"
#endif

bool imageGIF( void const    *inData,     // input
               unsigned long  inSize,     // input
               image_t       &image );    // output

#endif

