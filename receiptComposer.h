#ifndef __RECEIPTCOMPOSER_H__
#define __RECEIPTCOMPOSER_H__ "$Id$"

/*
 * receiptComposer.h
 *
 * This header file declares the receiptComposer_t class,
 * which lays out a customer receipt for a 32-column,
 * 384-dot thermal printer:
 *
 *              [logo]
 *            STORE NAME
 *
 *    Order #: 1042
 *    Date: 2007-03-01 12:30:00
 *    Cashier: Pat
 *
 *    QTY  ITEM                AMOUNT
 *    -------------------------------
 *     2  Coffee                 7.00
 *    -------------------------------
 *                 Subtotal:     7.00
 *                    TOTAL:     7.00
 *                  Payment:    10.00
 *                   Change:     3.00
 *
 *              [barcode]
 *     Thank you for your order!
 *          Come back soon!
 *
 * Money is carried in cents.
 *
 * The logo is fetched and rasterized on a separate thread
 * while the text is formatted. If it can't be loaded, the
 * receipt is printed without it. An invalid barcode is an
 * error, and nothing is produced.
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
#include <time.h>

#ifndef __BARCODEENCODER_H__
#include "barcodeEncoder.h"
#endif

#ifndef __RASTERENCODER_H__
#include "rasterEncoder.h"
#endif

#ifndef __RECEIPTCONFIG_H__
#include "receiptConfig.h"
#endif

#ifndef __COMMANDSTREAM_H__
#include "commandStream.h"
#endif

struct receiptItem_t {
   std::string name ;
   unsigned    quantity ;
   long        unitPrice ;    // cents
   long        lineTotal ;    // cents, not recomputed

   receiptItem_t( void )
      : quantity( 0 ), unitPrice( 0 ), lineTotal( 0 ){}
};

struct receiptDoc_t {
   std::string                orderId ;
   time_t                     timestamp ;
   std::vector<receiptItem_t> items ;
   long                       subtotal ;
   bool                       hasDiscount ;
   long                       discountAmount ;
   std::string                discountCode ;
   long                       total ;
   long                       amountPaid ;
   long                       change ;
   std::string                cashierName ;
   std::string                storeName ;
   std::string                logoUrl ;
   std::string                barcodePayload ;   // empty for none
   barcodeSpec_t              barcode ;

   receiptDoc_t( void );
};

//
// exactly n characters: truncated, or padded with spaces
// on the left (padLeft) or right (padRight)
//
std::string padLeft( std::string const &s, unsigned n );
std::string padRight( std::string const &s, unsigned n );

// 1234 -> "12.34", -500 -> "-5.00"
std::string formatMoney( long cents );

//
// "12", "12.5", "12.50" -> 1250. No more than two decimals,
// no exponents, no currency symbols.
//
bool parseMoney( char const *s, long &cents );

class receiptComposer_t {
public:
   enum {
      qtyColumns    = 2,
      nameColumns   = 18,
      amountColumns = 8,
      labelColumns  = 22,
      totalColumns  = 10
   };

   receiptComposer_t( imageSource_t          &source,
                      receiptConfig_t const  &config = receiptConfig_t(),
                      rasterConfig_t const   &rasterConfig = rasterConfig_t(),
                      barcodeConfig_t const  &barcodeConfig = barcodeConfig_t() );

   //
   // Lays out doc with an already-encoded logo (0 or empty
   // for none). The stream isn't flattened.
   //
   bool buildStream( receiptDoc_t const               &doc,
                     std::vector<unsigned char> const *logo,
                     commandStream_t                  &stream,
                     std::string                      &errorMsg );

   //
   // Full receipt. logoUrl overrides doc.logoUrl if non-null.
   // out is only filled in on success.
   //
   bool compose( receiptDoc_t const         &doc,
                 char const                 *logoUrl,
                 std::vector<unsigned char> &out,
                 std::string                &errorMsg );

   //
   // short receipt to check the connection to a printer
   //
   bool composeTestPage( std::string const          &storeName,
                         time_t                      when,
                         std::vector<unsigned char> &out,
                         std::string                &errorMsg );

   receiptConfig_t const &config( void ) const { return config_ ; }

private:
   receiptComposer_t( receiptComposer_t const & ); // no copies
   receiptComposer_t &operator=( receiptComposer_t const & );

   std::string formatDate( time_t when ) const ;
   void addHeader( std::vector<unsigned char> const *logo,
                   commandStream_t                  &stream );
   bool addBody( receiptDoc_t const &doc,
                 commandStream_t    &stream,
                 std::string        &errorMsg );

   receiptConfig_t const config_ ;
   rasterEncoder_t       raster_ ;
   barcodeEncoder_t      barcode_ ;
};

#endif

