#ifndef __IMGJPEG_H__
#define __IMGJPEG_H__ "$Id$"

/*
 * imgJPEG.h
 *
 * This header file declares the imageJPEG routine,
 * which is used to translate a hunk o' RAM into an
 * RGBA pixmap (see image.h).
 *
 * JPEG has no alpha, so every pixel comes back opaque.
 * Corrupt input is reported on stderr and returns false
 * instead of exiting (the libjpeg default).
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

bool imageJPEG( void const    *inData,     // input
                unsigned long  inSize,     // input
                image_t       &image );    // output

#endif

