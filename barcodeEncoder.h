#ifndef __BARCODEENCODER_H__
#define __BARCODEENCODER_H__ "$Id$"

/*
 * barcodeEncoder.h
 *
 * This header file declares the barcodeEncoder_t class,
 * which validates a barcode payload and generates the
 * ESC/POS commands to print it:
 *
 *    <ESC>@      initialize
 *    <GS>h n     height in dots [1,255]
 *    <GS>w n     module width [2,6]
 *    <GS>H n     HRI position (0:none, 1:above, 2:below, 3:both)
 *    <GS>f n     HRI font (0:A, 1:B)
 *    <GS>k m     symbology, then either
 *                   n d1...dn      (CODE39, ITF, CODE128)
 *                   d1...dk NUL    (UPC-A, EAN13, EAN8)
 *    LF...       lineFeeds of them
 *
 * Payload rules:
 *
 *    UPC_A       11 or 12 digits
 *    EAN13       12 or 13 digits
 *    EAN8        7 or 8 digits
 *    CODE39      0-9 A-Z - . space $ / + %
 *    ITF         an even number of digits
 *    CODE128     anything
 *
 * Empty payloads are always rejected, as are payloads too
 * long for the single length byte.
 *
 * A symbology value outside the enumeration is handled as
 * CODE128 (rules, type code and framing).
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

#include <string>
#include <vector>

enum barcodeSymbology_e {
   BC_UPC_A,
   BC_EAN13,
   BC_EAN8,
   BC_CODE39,
   BC_ITF,
   BC_CODE128,
   BC_NUMSYMBOLOGIES
};

extern char const *const barcodeSymbologyNames[BC_NUMSYMBOLOGIES];

//
// "CODE39", "CODE128", "EAN13", "EAN8", "UPC_A", "ITF"
//
bool parseSymbology( char const *name, barcodeSymbology_e &sym );
char const *symbologyName( barcodeSymbology_e sym );

enum hriPosition_e {
   HRI_NONE,
   HRI_ABOVE,
   HRI_BELOW,
   HRI_BOTH
};

enum hriFont_e {
   HRI_FONT_A,
   HRI_FONT_B
};

struct barcodeSpec_t {
   barcodeSymbology_e symbology ;
   int                heightDots ;     // clamped to [1,255]
   int                moduleWidth ;    // clamped to [2,6]
   hriPosition_e      hriPosition ;
   hriFont_e          hriFont ;
   unsigned           lineFeeds ;

   barcodeSpec_t( barcodeSymbology_e sym = BC_CODE128 )
      : symbology( sym )
      , heightDots( 162 )
      , moduleWidth( 3 )
      , hriPosition( HRI_BELOW )
      , hriFont( HRI_FONT_A )
      , lineFeeds( 2 ){}
};

struct barcodeConfig_t {
   unsigned char typeCodes[BC_NUMSYMBOLOGIES];
   unsigned char unknownTypeCode ;

   barcodeConfig_t( void );
};

class barcodeEncoder_t {
public:
   enum {
      maxPrefixedLength = 255
   };

   barcodeEncoder_t( barcodeConfig_t const &config = barcodeConfig_t() );

   //
   // returns true if payload can be printed as sym, otherwise
   // false with a message naming the symbology and the rule
   //
   static bool validate( std::string const  &payload,
                         barcodeSymbology_e  sym,
                         std::string        &errorMsg );

   // true if the payload is preceded by a length byte
   static bool lengthPrefixed( barcodeSymbology_e sym );

   //
   // appends the command sequence to out. Nothing is
   // appended if the payload doesn't validate.
   //
   bool encode( std::string const          &payload,
                barcodeSpec_t const        &spec,
                std::vector<unsigned char> &out,
                std::string                &errorMsg ) const ;

   unsigned char typeCode( barcodeSymbology_e sym ) const ;

   barcodeConfig_t const &config( void ) const { return config_ ; }

private:
   barcodeConfig_t const config_ ;
};

//
// validate and encode with the default configuration, then
// render the commands with hexString()
//
bool barcodeHex( std::string const   &payload,
                 barcodeSpec_t const &spec,
                 std::string         &hex,
                 std::string         &errorMsg );

#endif

