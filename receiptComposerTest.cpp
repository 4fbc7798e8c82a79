/*
 * Module receiptComposerTest.cpp
 *
 * This module tests the receipt layout, the padding and
 * money routines, and the logo handling of the
 * receiptComposer_t class
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
#include "imgScale.h"
#include <gtest/gtest.h>
#include <string.h>

//
// Serves a 16x2 half-gray logo for any URL, or fails
//
class fakeImageSource_t : public imageSource_t {
public:
   fakeImageSource_t( bool fail ) : fail_( fail ), loads_( 0 ){}

   virtual bool load( char const  *url,
                      image_t     &image,
                      std::string &errorMsg )
   {
      loads_++ ;
      if( fail_ )
      {
         errorMsg = std::string( url ) + ": not found" ;
         return false ;
      }
      image.allocate( 16, 2 );
      memset( image.pixData_, 0x80, 16*2*image_t::bytesPerPixel );
      for( unsigned i = 0 ; i < 32 ; i++ )
         image.pixData_[(i*4)+3] = 0xFF ;
      return true ;
   }

   virtual bool resize( image_t const &src,
                        unsigned       width,
                        unsigned       height,
                        bool           nearest,
                        image_t       &dest )
   {
      if( nearest )
         scaleNearest( src, width, height, dest );
      else
         scaleArea( src, width, height, dest );
      return true ;
   }

   bool     fail_ ;
   unsigned loads_ ;
};

// 2007-06-28, mid-day in any time zone
static time_t const orderTime = 1183032000 ;

static receiptDoc_t sampleOrder( void )
{
   receiptDoc_t doc ;
   doc.orderId = "1042" ;
   doc.timestamp = orderTime ;

   receiptItem_t item ;
   item.name = "Coffee" ;
   item.quantity = 2 ;
   item.unitPrice = 350 ;
   item.lineTotal = 700 ;
   doc.items.push_back( item );

   item.name = "Extra Large Caramel Macchiato" ;
   item.quantity = 1 ;
   item.unitPrice = 525 ;
   item.lineTotal = 525 ;
   doc.items.push_back( item );

   doc.subtotal = 1225 ;
   doc.total = 1225 ;
   doc.amountPaid = 2000 ;
   doc.change = 775 ;
   return doc ;
}

static std::string asString( std::vector<unsigned char> const &v )
{
   return std::string( v.begin(), v.end() );
}

TEST( padding, exactWidths )
{
   EXPECT_EQ( "             Subtotal:", padLeft( "Subtotal:", 22 ) );
   EXPECT_EQ( 22u, padLeft( "Subtotal:", 22 ).size() );
   EXPECT_EQ( "Item              ", padRight( "Item", 18 ) );
   EXPECT_EQ( 18u, padRight( "Item", 18 ).size() );
}

TEST( padding, truncatesLongInput )
{
   std::string const longName( "Extra Large Caramel Macchiato" );
   EXPECT_EQ( "Extra Large Carame", padRight( longName, 18 ) );
   EXPECT_EQ( "Extra Large Carame", padLeft( longName, 18 ) );
   EXPECT_EQ( "Sub", padLeft( "Subtotal:", 3 ) );
   EXPECT_EQ( "", padRight( "x", 0 ) );
   EXPECT_EQ( "    ", padLeft( "", 4 ) );
}

TEST( money, format )
{
   EXPECT_EQ( "50.00", formatMoney( 5000 ) );
   EXPECT_EQ( "0.05", formatMoney( 5 ) );
   EXPECT_EQ( "0.00", formatMoney( 0 ) );
   EXPECT_EQ( "-5.00", formatMoney( -500 ) );
   EXPECT_EQ( "1234.56", formatMoney( 123456 ) );
}

TEST( money, parse )
{
   long cents = 0 ;
   EXPECT_TRUE( parseMoney( "12", cents ) );
   EXPECT_EQ( 1200, cents );
   EXPECT_TRUE( parseMoney( "12.5", cents ) );
   EXPECT_EQ( 1250, cents );
   EXPECT_TRUE( parseMoney( "0.05", cents ) );
   EXPECT_EQ( 5, cents );
   EXPECT_TRUE( parseMoney( "-3.10", cents ) );
   EXPECT_EQ( -310, cents );
   EXPECT_FALSE( parseMoney( "1.234", cents ) );
   EXPECT_FALSE( parseMoney( "$5", cents ) );
   EXPECT_FALSE( parseMoney( "5x", cents ) );
   EXPECT_FALSE( parseMoney( "", cents ) );
}

TEST( receiptComposer, layoutWithoutLogo )
{
   fakeImageSource_t source( false );
   receiptComposer_t composer( source );

   std::vector<unsigned char> out ;
   std::string errorMsg ;
   ASSERT_TRUE( composer.compose( sampleOrder(), 0, out, errorMsg ) ) << errorMsg ;
   EXPECT_EQ( 0u, source.loads_ );

   std::string const s = asString( out );
   EXPECT_EQ( 0u, s.find( "\x1b@\x1b" "a\x01" "\x1d!" ) );
   EXPECT_NE( std::string::npos, s.find( "\x1b" "a" "\x00" "Order #: 1042\n", 0, 17 ) );
   EXPECT_NE( std::string::npos, s.find( "QTY  ITEM                AMOUNT\n"
                                        "-------------------------------\n"
                                        " 2  Coffee                7.00\n"
                                        " 1  Extra Large Carame    5.25\n"
                                        "-------------------------------\n"
                                        "             Subtotal:     12.25\n" ) );
   EXPECT_NE( std::string::npos, s.find( "               Change:      7.75\n\n" ) );
   EXPECT_EQ( std::string::npos, s.find( "Discount:" ) );
   EXPECT_EQ( std::string::npos, s.find( "Cashier:" ) );
   EXPECT_EQ( std::string::npos, s.find( "\x1dv0" ) );

   std::string const tail( "Thank you for your order!\nCome back soon!\n\n\n\n\x1dV" );
   ASSERT_LT( tail.size()+1, s.size() );
   EXPECT_EQ( tail, s.substr( s.size()-tail.size()-1, tail.size() ) );
   EXPECT_EQ( 0, out.back() );
}

TEST( receiptComposer, lengthMatchesSegments )
{
   fakeImageSource_t source( false );
   receiptComposer_t composer( source );
   receiptDoc_t doc = sampleOrder();
   doc.cashierName = "Pat" ;
   doc.storeName = "Corner Cafe" ;

   std::vector<unsigned char> logo( 30, 0x55 );
   commandStream_t stream ;
   std::string errorMsg ;
   ASSERT_TRUE( composer.buildStream( doc, &logo, stream, errorMsg ) );

   unsigned long sum = 0 ;
   for( unsigned i = 0 ; i < stream.segmentCount(); i++ )
      sum += stream.segmentLength( i );

   std::vector<unsigned char> out ;
   ASSERT_TRUE( stream.flatten( out ) );
   EXPECT_EQ( sum, out.size() );

   commandStream_t noLogo ;
   ASSERT_TRUE( composer.buildStream( doc, 0, noLogo, errorMsg ) );
   EXPECT_EQ( sum - 3 - 30 - 1, noLogo.totalLength() );

   std::vector<unsigned char> composed ;
   ASSERT_TRUE( composer.compose( doc, "", composed, errorMsg ) );
   EXPECT_EQ( noLogo.totalLength(), composed.size() );
}

TEST( receiptComposer, discountAboveTotal )
{
   fakeImageSource_t source( false );
   receiptComposer_t composer( source );

   receiptDoc_t doc ;
   doc.orderId = "7" ;
   doc.timestamp = orderTime ;
   doc.subtotal = 5000 ;
   doc.hasDiscount = true ;
   doc.discountAmount = 500 ;
   doc.discountCode = "SAVE5" ;
   doc.total = 4500 ;
   doc.amountPaid = 5000 ;
   doc.change = 500 ;

   std::vector<unsigned char> out ;
   std::string errorMsg ;
   ASSERT_TRUE( composer.compose( doc, 0, out, errorMsg ) );

   std::string const expected =
      "             Subtotal:     50.00\n"
      "             Discount:     -5.00\n"
      "                 Code:     SAVE5\n"
      "\x1b" "E" "\x01"
      "                TOTAL:     45.00\n"
      "\x1b" "E" ;
   EXPECT_NE( std::string::npos, asString( out ).find( expected ) );
}

TEST( receiptComposer, discountWithoutCode )
{
   fakeImageSource_t source( false );
   receiptComposer_t composer( source );
   receiptDoc_t doc = sampleOrder();
   doc.hasDiscount = true ;
   doc.discountAmount = 25 ;
   doc.total = 1200 ;

   std::vector<unsigned char> out ;
   std::string errorMsg ;
   ASSERT_TRUE( composer.compose( doc, 0, out, errorMsg ) );
   std::string const s = asString( out );
   EXPECT_NE( std::string::npos, s.find( "             Discount:     -0.25\n\x1b" "E" ) );
   EXPECT_EQ( std::string::npos, s.find( "Code:" ) );
}

TEST( receiptComposer, zeroDiscountOmitted )
{
   fakeImageSource_t source( false );
   receiptComposer_t composer( source );
   receiptDoc_t doc = sampleOrder();
   doc.hasDiscount = true ;
   doc.discountAmount = 0 ;
   doc.discountCode = "NOTHING" ;

   std::vector<unsigned char> out ;
   std::string errorMsg ;
   ASSERT_TRUE( composer.compose( doc, 0, out, errorMsg ) );
   EXPECT_EQ( std::string::npos, asString( out ).find( "Discount:" ) );
   EXPECT_EQ( std::string::npos, asString( out ).find( "NOTHING" ) );
}

TEST( receiptComposer, logoFirst )
{
   fakeImageSource_t source( false );
   receiptComposer_t composer( source );

   std::vector<unsigned char> withLogo, without ;
   std::string errorMsg ;
   ASSERT_TRUE( composer.compose( sampleOrder(), "logo.png", withLogo, errorMsg ) ) << errorMsg ;
   ASSERT_TRUE( composer.compose( sampleOrder(), 0, without, errorMsg ) );
   EXPECT_EQ( 1u, source.loads_ );

   // 16x2 logo: 2 bytes wide, 2 dots high
   unsigned char const head[] = {
      0x1B, 0x40,
      0x1B, 0x61, 0x01,
      0x1D, 0x76, 0x30, 0x00, 0x02, 0x00, 0x02, 0x00
   };
   ASSERT_LT( sizeof( head ), withLogo.size() );
   EXPECT_EQ( 0, memcmp( &withLogo[0], head, sizeof( head ) ) );
   EXPECT_EQ( '\n', withLogo[sizeof( head )+4] );
   EXPECT_EQ( without.size() + 3 + 8 + 4 + 1, withLogo.size() );
}

TEST( receiptComposer, docLogoUrlUsedByDefault )
{
   fakeImageSource_t source( false );
   receiptComposer_t composer( source );
   receiptDoc_t doc = sampleOrder();
   doc.logoUrl = "http://example.com/logo.png" ;

   std::vector<unsigned char> out ;
   std::string errorMsg ;
   ASSERT_TRUE( composer.compose( doc, 0, out, errorMsg ) );
   EXPECT_EQ( 1u, source.loads_ );
   EXPECT_NE( std::string::npos, asString( out ).find( "\x1dv0" ) );
}

TEST( receiptComposer, failedLogoStillPrints )
{
   fakeImageSource_t source( true );
   receiptComposer_t composer( source );

   std::vector<unsigned char> withLogo, without ;
   std::string errorMsg ;
   ASSERT_TRUE( composer.compose( sampleOrder(), "missing.png", withLogo, errorMsg ) );
   EXPECT_EQ( 1u, source.loads_ );
   ASSERT_TRUE( composer.compose( sampleOrder(), 0, without, errorMsg ) );
   EXPECT_EQ( without, withLogo );
   EXPECT_NE( std::string::npos, asString( withLogo ).find( "TOTAL:" ) );
}

TEST( receiptComposer, headerLines )
{
   fakeImageSource_t source( false );
   receiptConfig_t config ;
   config.dateFormat = "%Y" ;
   receiptComposer_t composer( source, config );

   receiptDoc_t doc = sampleOrder();
   doc.cashierName = "Pat" ;
   doc.storeName = "Corner Cafe" ;

   std::vector<unsigned char> out ;
   std::string errorMsg ;
   ASSERT_TRUE( composer.compose( doc, 0, out, errorMsg ) );
   std::string const s = asString( out );
   EXPECT_NE( std::string::npos, s.find( "\x1b" "a" "\x01" "\x1d!\x11" "Corner Cafe\n" "\x1d!" ) );
   EXPECT_NE( std::string::npos, s.find( "Order #: 1042\nDate: 2007\nCashier: Pat\n\nQTY" ) );
}

TEST( receiptComposer, configuredStoreAndFooter )
{
   fakeImageSource_t source( false );
   receiptConfig_t config ;
   config.storeName = "Default Store" ;
   config.footerLines.clear();
   config.footerLines.push_back( "See you" );
   receiptComposer_t composer( source, config );

   std::vector<unsigned char> out ;
   std::string errorMsg ;
   ASSERT_TRUE( composer.compose( sampleOrder(), 0, out, errorMsg ) );
   std::string const s = asString( out );
   EXPECT_NE( std::string::npos, s.find( "Default Store\n" ) );
   EXPECT_NE( std::string::npos, s.find( "See you\n\n\n\n" ) );
   EXPECT_EQ( std::string::npos, s.find( "Thank you" ) );
}

TEST( receiptComposer, barcodeBeforeFooter )
{
   fakeImageSource_t source( false );
   receiptComposer_t composer( source );
   receiptDoc_t doc = sampleOrder();
   doc.barcodePayload = "ORDER-1042" ;

   std::vector<unsigned char> out ;
   std::string errorMsg ;
   ASSERT_TRUE( composer.compose( doc, 0, out, errorMsg ) ) << errorMsg ;
   std::string const s = asString( out );
   std::string::size_type const bc = s.find( "\x1dk" "I" "\x0a" "ORDER-1042\n\n" );
   ASSERT_NE( std::string::npos, bc );
   EXPECT_LT( s.find( "Change:" ), bc );
   EXPECT_LT( bc, s.find( "Thank you" ) );
}

TEST( receiptComposer, barcodeCenteredAfterInit )
{
   fakeImageSource_t source( false );
   receiptComposer_t composer( source );
   receiptDoc_t doc = sampleOrder();
   doc.barcodePayload = "ORDER-1042" ;

   std::vector<unsigned char> out ;
   std::string errorMsg ;
   ASSERT_TRUE( composer.compose( doc, 0, out, errorMsg ) ) << errorMsg ;
   std::string const s = asString( out );

   // the barcode's own <ESC>@ is followed by center, then its setup
   std::string::size_type const init = s.find( "\x1b@", 2 );
   ASSERT_NE( std::string::npos, init );
   EXPECT_EQ( init, s.find( "\x1b@\x1b" "a\x01\x1dh" ) );
   EXPECT_LT( init, s.find( "\x1dk" "I" ) );
}

TEST( receiptComposer, invalidBarcodeFailsWholeReceipt )
{
   fakeImageSource_t source( false );
   receiptComposer_t composer( source );
   receiptDoc_t doc = sampleOrder();
   doc.barcodePayload = "12345" ;
   doc.barcode.symbology = BC_EAN13 ;

   std::vector<unsigned char> out ;
   std::string errorMsg ;
   EXPECT_FALSE( composer.compose( doc, "logo.png", out, errorMsg ) );
   EXPECT_TRUE( out.empty() );
   EXPECT_NE( std::string::npos, errorMsg.find( "EAN13" ) );
   EXPECT_EQ( 0u, source.loads_ );
}

TEST( receiptComposer, testPage )
{
   fakeImageSource_t source( false );
   receiptComposer_t composer( source );

   std::vector<unsigned char> out ;
   std::string errorMsg ;
   ASSERT_TRUE( composer.composeTestPage( "Corner Cafe", orderTime, out, errorMsg ) );
   std::string const s = asString( out );
   EXPECT_EQ( 0u, s.find( "\x1b@\x1b" "a\x01\x1d!\x11" "Corner Cafe\n" ) );
   EXPECT_NE( std::string::npos, s.find( "Test Receipt\nDate: 2007-" ) );
   EXPECT_NE( std::string::npos, s.find( "Connection successful!\n" ) );
   EXPECT_NE( std::string::npos, s.find( "Thank you!\n\n\n\n\x1dV" ) );
   EXPECT_EQ( 0, out.back() );
}
