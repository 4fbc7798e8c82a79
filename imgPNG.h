#ifndef __IMGPNG_H__
#define __IMGPNG_H__ "$Id$"

/*
 * imgPNG.h
 *
 * This header file declares the imagePNG() routine,
 * which tries to convert a hunk of memory into an RGBA
 * pixmap (see image.h) by translating PNG.
 *
 * Palette, grey and 16-bit images are expanded to
 * 8-bit RGBA. Images without an alpha channel (or tRNS
 * chunk) come back fully opaque.
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

bool imagePNG( void const    *inData,     // input
               unsigned long  inSize,     // input
               image_t       &image );    // output

#endif

