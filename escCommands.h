#ifndef __ESCCOMMANDS_H__
#define __ESCCOMMANDS_H__ "$Id$"

/*
 * escCommands.h
 *
 * This header file declares the ESC/POS command sequences
 * used by the receipt code:
 *
 *    <ESC>@            - initialize printer
 *    <ESC>a n          - justification (0:left, 1:center)
 *    <ESC>E n          - emphasized (bold) on/off
 *    <GS>! n           - character size (0x11 is double w/h)
 *    <GS>V 0           - full cut
 *    <GS>v0 0 xL xH yL yH d1...dk
 *                      - raster bit image, normal density
 *
 * and the barcode prefixes, each followed by a single
 * parameter byte:
 *
 *    <GS>h n           - bar height in dots
 *    <GS>w n           - module width
 *    <GS>H n           - HRI position
 *    <GS>f n           - HRI font
 *    <GS>k m           - print barcode of type m
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

#define ESC 0x1b
#define GS  0x1d

static unsigned char const escInitPrinter[] = {
   ESC, '@'
};

static unsigned char const escAlignLeft[] = {
   ESC, 'a', 0
};

static unsigned char const escAlignCenter[] = {
   ESC, 'a', 1
};

static unsigned char const escBoldOn[] = {
   ESC, 'E', 1
};

static unsigned char const escBoldOff[] = {
   ESC, 'E', 0
};

static unsigned char const escDoubleSize[] = {
   GS, '!', 0x11
};

static unsigned char const escNormalSize[] = {
   GS, '!', 0x00
};

static unsigned char const escFullCut[] = {
   GS, 'V', 0
};

static unsigned char const escRasterImage[] = {
   GS, 'v', '0', 0
};

static unsigned char const escBarcodeHeight[] = {
   GS, 'h'
};

static unsigned char const escBarcodeWidth[] = {
   GS, 'w'
};

static unsigned char const escBarcodeHRIPos[] = {
   GS, 'H'
};

static unsigned char const escBarcodeHRIFont[] = {
   GS, 'f'
};

static unsigned char const escBarcodePrint[] = {
   GS, 'k'
};

#undef ESC
#undef GS

#endif

