/*
 * Module receiptComposer.cpp
 *
 * This module defines the methods of the receiptComposer_t
 * class and the padding routines as declared in
 * receiptComposer.h
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
#include "escCommands.h"
#include <pthread.h>
#include <string.h>
#include <stdio.h>
#include <stdlib.h>
#include <ctype.h>

#include "debugPrint.h"

static char const divider[] = {
   "-------------------------------\n"
};

static char const columnHeader[] = {
   "QTY  ITEM                AMOUNT\n"
};

receiptDoc_t :: receiptDoc_t( void )
   : orderId()
   , timestamp( 0 )
   , items()
   , subtotal( 0 )
   , hasDiscount( false )
   , discountAmount( 0 )
   , discountCode()
   , total( 0 )
   , amountPaid( 0 )
   , change( 0 )
{
}

std::string padLeft( std::string const &s, unsigned n )
{
   if( s.size() >= n )
      return s.substr( 0, n );
   return std::string( n - s.size(), ' ' ) + s ;
}

std::string padRight( std::string const &s, unsigned n )
{
   if( s.size() >= n )
      return s.substr( 0, n );
   return s + std::string( n - s.size(), ' ' );
}

std::string formatMoney( long cents )
{
   char buf[32];
   unsigned long const magnitude = ( 0 > cents ) ? -(unsigned long)cents : (unsigned long)cents ;
   snprintf( buf, sizeof( buf ), "%s%lu.%02lu",
             ( 0 > cents ) ? "-" : "",
             magnitude / 100, magnitude % 100 );
   return buf ;
}

bool parseMoney( char const *s, long &cents )
{
   bool negative = false ;
   if( '-' == *s )
   {
      negative = true ;
      s++ ;
   }
   if( !isdigit( (unsigned char)*s ) )
      return false ;

   char *end ;
   long const whole = strtol( s, &end, 10 );
   long fraction = 0 ;
   if( '.' == *end )
   {
      end++ ;
      unsigned digits = 0 ;
      while( isdigit( (unsigned char)*end ) )
      {
         if( 2 <= digits++ )
            return false ;
         fraction = (fraction*10) + ( *end++ - '0' );
      }
      if( 1 == digits )
         fraction *= 10 ;
   }
   if( '\0' != *end )
      return false ;

   cents = (whole*100) + fraction ;
   if( negative )
      cents = -cents ;
   return true ;
}

static std::string totalLine( char const *label, std::string const &value )
{
   return padLeft( label, receiptComposer_t::labelColumns )
        + padLeft( value, receiptComposer_t::totalColumns )
        + "\n" ;
}

struct logoJob_t {
   rasterEncoder_t           *encoder ;
   std::string                url ;
   unsigned                   widthDots ;
   rasterMode_t               mode ;
   std::vector<unsigned char> bytes ;
   std::string                errorMsg ;
   bool                       worked ;
};

static void runLogoJob( logoJob_t &job )
{
   job.worked = job.encoder->encodeURL( job.url.c_str(), job.widthDots, job.mode, job.bytes, job.errorMsg );
   if( !job.worked )
      job.bytes.clear();
}

static void *logoThread( void *arg )
{
   runLogoJob( *(logoJob_t *)arg );
   return 0 ;
}

receiptComposer_t :: receiptComposer_t( imageSource_t          &source,
                                        receiptConfig_t const  &config,
                                        rasterConfig_t const   &rasterConfig,
                                        barcodeConfig_t const  &barcodeConfig )
   : config_( config )
   , raster_( source, rasterConfig )
   , barcode_( barcodeConfig )
{
}

std::string receiptComposer_t :: formatDate( time_t when ) const
{
   struct tm tmWhen ;
   char buf[128];
   if( ( 0 != localtime_r( &when, &tmWhen ) )
       &&
       ( 0 < strftime( buf, sizeof( buf ), config_.dateFormat.c_str(), &tmWhen ) ) )
      return buf ;
   return std::string();
}

void receiptComposer_t :: addHeader( std::vector<unsigned char> const *logo,
                                     commandStream_t                  &stream )
{
   stream.add( escInitPrinter, sizeof( escInitPrinter ) );
   if( logo && !logo->empty() )
   {
      stream.add( escAlignCenter, sizeof( escAlignCenter ) );
      stream.add( *logo );
      stream.add( "\n" );
   }
}

bool receiptComposer_t :: addBody( receiptDoc_t const &doc,
                                   commandStream_t    &stream,
                                   std::string        &errorMsg )
{
   std::string const &storeName = doc.storeName.empty() ? config_.storeName : doc.storeName ;
   stream.add( escAlignCenter, sizeof( escAlignCenter ) );
   if( !storeName.empty() )
   {
      stream.add( escDoubleSize, sizeof( escDoubleSize ) );
      stream.add( storeName + "\n" );
   }
   stream.add( escNormalSize, sizeof( escNormalSize ) );
   stream.add( "\n" );

   stream.add( escAlignLeft, sizeof( escAlignLeft ) );
   stream.add( "Order #: " + doc.orderId + "\n" );
   stream.add( "Date: " + formatDate( doc.timestamp ) + "\n" );
   if( !doc.cashierName.empty() )
      stream.add( "Cashier: " + doc.cashierName + "\n" );
   stream.add( "\n" );

   stream.add( columnHeader );
   stream.add( divider );
   for( unsigned i = 0 ; i < doc.items.size(); i++ )
   {
      receiptItem_t const &item = doc.items[i];
      if( item.name.size() > nameColumns )
         debugPrint( "item %u: name truncated to %u columns: %s\n", i, (unsigned)nameColumns, item.name.c_str() );
      char qty[16];
      snprintf( qty, sizeof( qty ), "%u", item.quantity );
      stream.add( padLeft( qty, qtyColumns )
                  + "  "
                  + padRight( item.name, nameColumns )
                  + padLeft( formatMoney( item.lineTotal ), amountColumns )
                  + "\n" );
   }
   stream.add( divider );

   stream.add( totalLine( "Subtotal:", formatMoney( doc.subtotal ) ) );
   if( doc.hasDiscount && ( 0 < doc.discountAmount ) )
   {
      stream.add( totalLine( "Discount:", "-" + formatMoney( doc.discountAmount ) ) );
      if( !doc.discountCode.empty() )
         stream.add( totalLine( "Code:", doc.discountCode ) );
   }
   stream.add( escBoldOn, sizeof( escBoldOn ) );
   stream.add( totalLine( "TOTAL:", formatMoney( doc.total ) ) );
   stream.add( escBoldOff, sizeof( escBoldOff ) );
   stream.add( totalLine( "Payment:", formatMoney( doc.amountPaid ) ) );
   stream.add( totalLine( "Change:", formatMoney( doc.change ) ) );
   stream.add( "\n" );

   if( !doc.barcodePayload.empty() )
   {
      std::vector<unsigned char> bc ;
      if( !barcode_.encode( doc.barcodePayload, doc.barcode, bc, errorMsg ) )
         return false ;
      // <ESC>@ resets justification, so center after it
      stream.add( &bc[0], sizeof( escInitPrinter ) );
      stream.add( escAlignCenter, sizeof( escAlignCenter ) );
      stream.add( &bc[sizeof( escInitPrinter )], bc.size()-sizeof( escInitPrinter ) );
   }

   stream.add( escAlignCenter, sizeof( escAlignCenter ) );
   for( unsigned i = 0 ; i < config_.footerLines.size(); i++ )
      stream.add( config_.footerLines[i] + "\n" );
   stream.add( "\n\n\n" );
   stream.add( escFullCut, sizeof( escFullCut ) );
   return true ;
}

bool receiptComposer_t :: buildStream( receiptDoc_t const               &doc,
                                       std::vector<unsigned char> const *logo,
                                       commandStream_t                  &stream,
                                       std::string                      &errorMsg )
{
   addHeader( logo, stream );
   return addBody( doc, stream, errorMsg );
}

bool receiptComposer_t :: compose( receiptDoc_t const         &doc,
                                   char const                 *logoUrl,
                                   std::vector<unsigned char> &out,
                                   std::string                &errorMsg )
{
   out.clear();
   errorMsg.clear();

   // an invalid barcode fails before the logo is started
   if( !doc.barcodePayload.empty()
       &&
       !barcodeEncoder_t::validate( doc.barcodePayload, doc.barcode.symbology, errorMsg ) )
      return false ;

   if( 0 == logoUrl )
      logoUrl = doc.logoUrl.c_str();

   logoJob_t job ;
   job.encoder   = &raster_ ;
   job.url       = logoUrl ;
   job.widthDots = config_.logoWidthDots ;
   job.mode      = config_.logoMode ;
   job.worked    = false ;

   bool const haveLogo = !job.url.empty();
   bool threaded = false ;
   pthread_t logoHandle ;
   if( haveLogo )
   {
      int const create = pthread_create( &logoHandle, 0, logoThread, &job );
      if( 0 == create )
         threaded = true ;
      else
      {
         fprintf( stderr, "Error %d creating logo thread, loading in-line\n", create );
         runLogoJob( job );
      }
   }

   commandStream_t body ;
   bool const bodyOK = addBody( doc, body, errorMsg );

   if( threaded )
   {
      void *exitStat ;
      int const result = pthread_join( logoHandle, &exitStat );
      if( 0 != result )
      {
         fprintf( stderr, "Error %d waiting for logo thread\n", result );
         job.worked = false ;
         job.bytes.clear();
      }
   }

   if( !bodyOK )
      return false ;

   if( haveLogo && !job.worked )
      fprintf( stderr, "logo omitted: %s\n", job.errorMsg.c_str() );

   commandStream_t stream ;
   addHeader( &job.bytes, stream );
   stream.append( body );

   if( !stream.flatten( out ) )
   {
      errorMsg = "internal error assembling receipt" ;
      out.clear();
      return false ;
   }

   debugPrint( "receipt %s: %u segments, %lu bytes\n",
               doc.orderId.c_str(), stream.segmentCount(), (unsigned long)out.size() );
   return true ;
}

bool receiptComposer_t :: composeTestPage( std::string const          &storeName,
                                           time_t                      when,
                                           std::vector<unsigned char> &out,
                                           std::string                &errorMsg )
{
   out.clear();
   errorMsg.clear();

   std::string const &name = storeName.empty() ? config_.storeName : storeName ;

   commandStream_t stream ;
   stream.add( escInitPrinter, sizeof( escInitPrinter ) );
   stream.add( escAlignCenter, sizeof( escAlignCenter ) );
   stream.add( escDoubleSize, sizeof( escDoubleSize ) );
   stream.add( name + "\n" );
   stream.add( escNormalSize, sizeof( escNormalSize ) );
   stream.add( "\n" );
   stream.add( escAlignLeft, sizeof( escAlignLeft ) );
   stream.add( "Test Receipt\n" );
   stream.add( "Date: " + formatDate( when ) + "\n" );
   stream.add( "\n" );
   stream.add( "Connection successful!\n" );
   stream.add( "\n" );
   stream.add( escAlignCenter, sizeof( escAlignCenter ) );
   stream.add( "Thank you!\n" );
   stream.add( "\n\n\n" );
   stream.add( escFullCut, sizeof( escFullCut ) );

   if( !stream.flatten( out ) )
   {
      errorMsg = "internal error assembling test page" ;
      out.clear();
      return false ;
   }
   return true ;
}

