#ifndef __RECEIPTCONFIG_H__
#define __RECEIPTCONFIG_H__ "$Id$"

/*
 * receiptConfig.h
 *
 * This header file declares the receiptConfig_t structure,
 * which holds the settings for a receipt that don't come
 * from the order itself.
 *
 * fromEnvironment() overrides the defaults with any of
 * these environment variables:
 *
 *    RECEIPT_STORE_NAME    - store name used when the order has none
 *    RECEIPT_DATE_FORMAT   - strftime() format for the date line
 *    RECEIPT_FOOTER        - footer lines, separated by '|'
 *    RECEIPT_LOGO_WIDTH    - max logo width in dots
 *    RECEIPT_LOGO_MODE     - threshold, dithered or fast
 *    RECEIPT_PRINTER       - output device or file ("-" is stdout)
 *    RECEIPT_CHUNK_SIZE    - bytes per write() to the printer
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

#ifndef __RASTERENCODER_H__
#include "rasterEncoder.h"
#endif

struct receiptConfig_t {
   std::string              storeName ;
   std::string              dateFormat ;
   std::vector<std::string> footerLines ;
   unsigned                 logoWidthDots ;
   rasterMode_t             logoMode ;
   std::string              printerPath ;
   unsigned                 chunkSize ;

   receiptConfig_t( void );

   void fromEnvironment( void );
};

//
// splits "a|b|c" into lines. Empty pieces are kept.
//
void splitFooter( char const               *value,
                  std::vector<std::string> &lines );

#endif

