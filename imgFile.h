#ifndef __IMGFILE_H__
#define __IMGFILE_H__ "$Id$"

/*
 * imgFile.h
 *
 * This header file declares the imageFromFile() and
 * imageFromMemory() routines, which try to load an image
 * by sniffing its signature (PNG, JPEG or GIF) and handing
 * it to the matching decoder.
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

#include "image.h"

image_t::type_e imageType( void const   *data,
                           unsigned long length );

bool imageFromMemory( void const   *data,
                      unsigned long length,
                      image_t      &image );

bool imageFromFile( char const *fileName,
                    image_t    &image );

#endif

