/*
 * Program receiptPrint.cpp
 *
 * This program builds a customer receipt from the command
 * line and sends it to a printer (or file, or stdout).
 *
 *    receiptPrint -s "Corner Cafe" -o 1042 -c Pat \
 *                 -i 2:Coffee:3.50 -i 1:Muffin:2.25 \
 *                 -d 0.75:SAVE -p 10 \
 *                 -l logo.png -b CODE128:1042 \
 *                 -f /dev/usb/lp0
 *
 * Defaults for the store name, footer, logo and printer
 * come from the environment (see receiptConfig.h).
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "receiptComposer.h"
#include "receiptConfig.h"
#include "printerPort.h"
#include "imageSource.h"
#include "hexDump.h"
#include <unistd.h>
#include <stdlib.h>
#include <string.h>
#include <stdio.h>
#include <time.h>

static void print_usage( char const *prog_name )
{
   fprintf( stderr,
            "Usage: %s [options]\n"
            "where\n"
            "   -i qty:name:price[:total] - add an item (repeat as needed)\n"
            "   -o orderId                - order number\n"
            "   -c cashier                - cashier name\n"
            "   -s storeName              - store name\n"
            "   -d amount[:code]          - discount\n"
            "   -p amount                 - amount paid (default total)\n"
            "   -l url                    - logo image (path or URL)\n"
            "   -m mode                   - logo mode: threshold, dithered, fast\n"
            "   -b SYMBOLOGY:payload      - barcode (CODE39, CODE128, EAN13, EAN8, UPC_A, ITF)\n"
            "   -t                        - print a test page instead\n"
            "   -x                        - write hex to stdout instead of printing\n"
            "   -f path                   - printer device or file (- for stdout)\n"
            "   -h                        - displays this usage\n",
            prog_name );
}

static bool parseItem( char const *arg, receiptItem_t &item )
{
   std::string const s( arg );
   std::string fields[4];
   unsigned numFields = 0 ;
   std::string::size_type start = 0 ;
   while( numFields < 4 )
   {
      std::string::size_type const colon = s.find( ':', start );
      if( std::string::npos == colon )
      {
         fields[numFields++] = s.substr( start );
         start = std::string::npos ;
         break ;
      }
      fields[numFields++] = s.substr( start, colon-start );
      start = colon+1 ;
   }

   if( ( std::string::npos != start ) || ( 3 > numFields ) )
      return false ;

   char *end ;
   unsigned long const qty = strtoul( fields[0].c_str(), &end, 10 );
   if( fields[0].empty() || ( '\0' != *end ) )
      return false ;

   item.quantity = (unsigned)qty ;
   item.name = fields[1];
   if( !parseMoney( fields[2].c_str(), item.unitPrice ) )
      return false ;
   if( 4 == numFields )
      return parseMoney( fields[3].c_str(), item.lineTotal );

   item.lineTotal = item.unitPrice * (long)qty ;
   return true ;
}

int main( int argc, char *argv[] )
{
   receiptConfig_t config ;
   config.fromEnvironment();

   receiptDoc_t doc ;
   doc.orderId = "1" ;
   doc.timestamp = time( 0 );

   bool testPage = false ;
   bool hexOut = false ;
   bool havePaid = false ;
   int opt ;

   while( ( opt = getopt( argc, argv, "i:o:c:s:d:p:l:m:b:txf:h" ) ) != -1 ) {
      switch( opt ) {
         case 'i': {
            receiptItem_t item ;
            if( !parseItem( optarg, item ) )
            {
               fprintf( stderr, "Invalid item %s\n", optarg );
               return -1 ;
            }
            doc.items.push_back( item );
            break ;
         }
         case 'o':
            doc.orderId = optarg ;
            break ;
         case 'c':
            doc.cashierName = optarg ;
            break ;
         case 's':
            doc.storeName = optarg ;
            break ;
         case 'd': {
            char *colon = strchr( optarg, ':' );
            if( colon )
            {
               *colon = '\0' ;
               doc.discountCode = colon+1 ;
            }
            if( !parseMoney( optarg, doc.discountAmount ) )
            {
               fprintf( stderr, "Invalid discount %s\n", optarg );
               return -1 ;
            }
            doc.hasDiscount = true ;
            break ;
         }
         case 'p':
            if( !parseMoney( optarg, doc.amountPaid ) )
            {
               fprintf( stderr, "Invalid payment %s\n", optarg );
               return -1 ;
            }
            havePaid = true ;
            break ;
         case 'l':
            doc.logoUrl = optarg ;
            break ;
         case 'm':
            if( !rasterMode_t::parse( optarg, config.logoMode.type ) )
            {
               fprintf( stderr, "Invalid logo mode %s\n", optarg );
               return -1 ;
            }
            break ;
         case 'b': {
            char *colon = strchr( optarg, ':' );
            if( 0 == colon )
            {
               fprintf( stderr, "Invalid barcode %s, use SYMBOLOGY:payload\n", optarg );
               return -1 ;
            }
            *colon = '\0' ;
            if( !parseSymbology( optarg, doc.barcode.symbology ) )
            {
               fprintf( stderr, "Unknown symbology %s\n", optarg );
               return -1 ;
            }
            doc.barcodePayload = colon+1 ;
            break ;
         }
         case 't':
            testPage = true ;
            break ;
         case 'x':
            hexOut = true ;
            break ;
         case 'f':
            config.printerPath = optarg ;
            break ;
         case 'h':
            print_usage( argv[0] );
            return 0 ;
         default:
            print_usage( argv[0] );
            return -1 ;
      }
   }

   doc.subtotal = 0 ;
   for( unsigned i = 0 ; i < doc.items.size(); i++ )
      doc.subtotal += doc.items[i].lineTotal ;
   doc.total = doc.subtotal - ( doc.hasDiscount ? doc.discountAmount : 0 );
   if( !havePaid )
      doc.amountPaid = doc.total ;
   doc.change = doc.amountPaid - doc.total ;

   urlImageSource_t source ;
   receiptComposer_t composer( source, config );

   std::vector<unsigned char> out ;
   std::string errorMsg ;
   bool const worked = testPage
                       ? composer.composeTestPage( doc.storeName, doc.timestamp, out, errorMsg )
                       : composer.compose( doc, 0, out, errorMsg );
   if( !worked )
   {
      fprintf( stderr, "%s\n", errorMsg.c_str() );
      return -1 ;
   }

   if( hexOut )
   {
      printf( "%s\n", hexString( out.empty() ? 0 : &out[0], out.size() ).c_str() );
      return 0 ;
   }

   devicePort_t port( config.printerPath.c_str(), config.chunkSize );
   if( !port.isOpen() )
   {
      fprintf( stderr, "Error %s opening %s\n", port.getError(), config.printerPath.c_str() );
      return -1 ;
   }

   if( !port.write( out.empty() ? 0 : &out[0], out.size(), errorMsg ) )
   {
      fprintf( stderr, "%s\n", errorMsg.c_str() );
      return -1 ;
   }

   return 0 ;
}

