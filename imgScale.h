#ifndef __IMGSCALE_H__
#define __IMGSCALE_H__ "$Id$"

/*
 * imgScale.h
 *
 * This header file declares the image scaling routines
 * used to fit a logo to the printable width of the paper:
 *
 *    scaleArea()    - each output pixel is the average of
 *                     the source pixels it covers. Colors
 *                     are weighted by alpha so transparent
 *                     edges don't darken the result.
 *
 *    scaleNearest() - each output pixel is a copy of the
 *                     nearest source pixel. Cheap, and the
 *                     one used for "fast" logos.
 *
 * Both work in either direction (up or down) and leave
 * the source untouched. scaledSize() computes the output
 * size for a maximum width, preserving aspect ratio and
 * never scaling up.
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

void scaleArea( image_t const &src,
                unsigned       width,
                unsigned       height,
                image_t       &dest );

void scaleNearest( image_t const &src,
                   unsigned       width,
                   unsigned       height,
                   image_t       &dest );

//
// width = min( srcWidth, maxWidth ), height follows
// (rounded down, at least 1)
//
void scaledSize( unsigned  srcWidth,
                 unsigned  srcHeight,
                 unsigned  maxWidth,
                 unsigned &width,
                 unsigned &height );

#endif

