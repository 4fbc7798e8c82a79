/*
 * Module rasterEncoderTest.cpp
 *
 * This module tests the rasterEncoder_t class and the
 * <GS>v0 framing as declared in rasterEncoder.h
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "rasterEncoder.h"
#include <gtest/gtest.h>

static void fillGray( image_t &img, unsigned w, unsigned h, unsigned char gray )
{
   img.allocate( w, h );
   for( unsigned y = 0 ; y < h ; y++ )
      for( unsigned x = 0 ; x < w ; x++ )
      {
         unsigned char *p = img.pixel( x, y );
         p[0] = p[1] = p[2] = gray ;
         p[3] = 255 ;
      }
}

TEST( rasterCommand, framing )
{
   monoBitmap_t bitmap ;
   bitmap.byteWidth = 2 ;
   bitmap.dotHeight = 2 ;
   bitmap.rows.push_back( 0xF0 );
   bitmap.rows.push_back( 0x01 );
   bitmap.rows.push_back( 0x80 );
   bitmap.rows.push_back( 0x00 );

   std::vector<unsigned char> out ;
   out.push_back( 0xAA );
   rasterCommand( bitmap, out );

   unsigned char const expected[] = {
      0xAA,
      0x1D, 0x76, 0x30, 0x00,
      0x02, 0x00, 0x02, 0x00,
      0xF0, 0x01, 0x80, 0x00
   };
   ASSERT_EQ( sizeof( expected ), out.size() );
   for( unsigned i = 0 ; i < sizeof( expected ); i++ )
      EXPECT_EQ( expected[i], out[i] ) << "byte " << i ;
}

TEST( rasterEncoder, wideImageScaledToPaper )
{
   image_t img ;
   fillGray( img, 800, 400, 128 );

   urlImageSource_t source ;
   rasterEncoder_t encoder( source );
   std::vector<unsigned char> out ;
   std::string errorMsg ;
   ASSERT_TRUE( encoder.encode( img, 384, rasterMode_t( rasterMode_t::dithered ), out, errorMsg ) ) << errorMsg ;

   ASSERT_EQ( 8u + 48u*192u, out.size() );
   EXPECT_EQ( 0x1D, out[0] );
   EXPECT_EQ( 0x76, out[1] );
   EXPECT_EQ( 0x30, out[2] );
   EXPECT_EQ( 0x00, out[3] );
   EXPECT_EQ( 48, out[4] );
   EXPECT_EQ( 0, out[5] );
   EXPECT_EQ( 192, out[6] );
   EXPECT_EQ( 0, out[7] );
}

TEST( rasterEncoder, configuredWidthByDefault )
{
   image_t img ;
   fillGray( img, 800, 400, 128 );

   urlImageSource_t source ;
   rasterEncoder_t encoder( source );
   monoBitmap_t bitmap ;
   std::string errorMsg ;
   ASSERT_TRUE( encoder.toBitmap( img, 0, rasterMode_t(), bitmap, errorMsg ) );
   EXPECT_EQ( 48u, bitmap.byteWidth );
   EXPECT_EQ( 192u, bitmap.dotHeight );
   EXPECT_EQ( 48u*192u, bitmap.rows.size() );
}

TEST( rasterEncoder, smallImageNotScaledUp )
{
   image_t img ;
   fillGray( img, 100, 10, 255 );

   urlImageSource_t source ;
   rasterEncoder_t encoder( source );
   monoBitmap_t bitmap ;
   std::string errorMsg ;
   ASSERT_TRUE( encoder.toBitmap( img, 384, rasterMode_t( rasterMode_t::threshold ), bitmap, errorMsg ) );
   EXPECT_EQ( 13u, bitmap.byteWidth );
   EXPECT_EQ( 10u, bitmap.dotHeight );

   // white prints, and the 4 padding dots of each row don't
   for( unsigned y = 0 ; y < 10 ; y++ )
   {
      EXPECT_TRUE( bitmap.prints( 99, y ) );
      EXPECT_EQ( 0xF0, bitmap.rows[(y*13)+12] );
   }
}

TEST( rasterEncoder, fastModeHalvesRows )
{
   image_t img ;
   fillGray( img, 800, 400, 128 );

   urlImageSource_t source ;
   rasterEncoder_t encoder( source );
   monoBitmap_t bitmap ;
   std::string errorMsg ;
   ASSERT_TRUE( encoder.toBitmap( img, 0, rasterMode_t( rasterMode_t::fast ), bitmap, errorMsg ) );
   EXPECT_EQ( 24u, bitmap.byteWidth );
   EXPECT_EQ( 48u, bitmap.dotHeight );

   ASSERT_TRUE( encoder.toBitmap( img, 0, rasterMode_t( rasterMode_t::fast, 0, 1 ), bitmap, errorMsg ) );
   EXPECT_EQ( 96u, bitmap.dotHeight );

   ASSERT_TRUE( encoder.toBitmap( img, 384, rasterMode_t( rasterMode_t::fast, 0, 4 ), bitmap, errorMsg ) );
   EXPECT_EQ( 48u, bitmap.byteWidth );
   EXPECT_EQ( 48u, bitmap.dotHeight );
}

TEST( rasterEncoder, fastModeAtLeastOneRow )
{
   image_t img ;
   fillGray( img, 8, 1, 128 );

   urlImageSource_t source ;
   rasterEncoder_t encoder( source );
   monoBitmap_t bitmap ;
   std::string errorMsg ;
   ASSERT_TRUE( encoder.toBitmap( img, 0, rasterMode_t( rasterMode_t::fast ), bitmap, errorMsg ) );
   EXPECT_EQ( 1u, bitmap.dotHeight );
}

TEST( rasterEncoder, thresholdLevel )
{
   image_t img ;
   fillGray( img, 8, 1, 150 );

   urlImageSource_t source ;
   rasterEncoder_t encoder( source );
   monoBitmap_t bitmap ;
   std::string errorMsg ;

   ASSERT_TRUE( encoder.toBitmap( img, 0, rasterMode_t( rasterMode_t::threshold ), bitmap, errorMsg ) );
   EXPECT_EQ( 0x00, bitmap.rows[0] );

   ASSERT_TRUE( encoder.toBitmap( img, 0, rasterMode_t( rasterMode_t::threshold, 200 ), bitmap, errorMsg ) );
   EXPECT_EQ( 0xFF, bitmap.rows[0] );
}

TEST( rasterEncoder, configuredCutoffs )
{
   image_t img ;
   fillGray( img, 8, 1, 20 );

   rasterConfig_t config ;
   config.darkCutoff = 10 ;
   urlImageSource_t source ;
   rasterEncoder_t encoder( source, config );
   monoBitmap_t bitmap ;
   std::string errorMsg ;

   // no longer forced off, so it's thresholded (and prints)
   ASSERT_TRUE( encoder.toBitmap( img, 0, rasterMode_t( rasterMode_t::threshold ), bitmap, errorMsg ) );
   EXPECT_EQ( 0xFF, bitmap.rows[0] );
}

TEST( rasterEncoder, emptyImageFails )
{
   image_t img ;
   urlImageSource_t source ;
   rasterEncoder_t encoder( source );
   std::vector<unsigned char> out ;
   std::string errorMsg ;
   EXPECT_FALSE( encoder.encode( img, 384, rasterMode_t(), out, errorMsg ) );
   EXPECT_FALSE( errorMsg.empty() );
   EXPECT_TRUE( out.empty() );
}

TEST( rasterEncoder, tooWideFails )
{
   // 65536 bytes of dots won't fit the 16-bit width field
   image_t img ;
   fillGray( img, 0x10000*8, 1, 255 );

   urlImageSource_t source ;
   rasterEncoder_t encoder( source );
   std::vector<unsigned char> out ;
   std::string errorMsg ;
   EXPECT_FALSE( encoder.encode( img, 0x10000*8, rasterMode_t( rasterMode_t::threshold ), out, errorMsg ) );
   EXPECT_NE( std::string::npos, errorMsg.find( "too wide" ) );
   EXPECT_TRUE( out.empty() );

   // one byte less fits
   monoBitmap_t bitmap ;
   ASSERT_TRUE( encoder.toBitmap( img, 0xFFFF*8, rasterMode_t( rasterMode_t::threshold ), bitmap, errorMsg ) ) << errorMsg ;
   EXPECT_EQ( 0xFFFFu, bitmap.byteWidth );
}

TEST( rasterEncoder, missingFileFails )
{
   urlImageSource_t source ;
   rasterEncoder_t encoder( source );
   std::vector<unsigned char> out ;
   std::string errorMsg ;
   EXPECT_FALSE( encoder.encodeURL( "/nonexistent/logo.png", 384, rasterMode_t(), out, errorMsg ) );
   EXPECT_NE( std::string::npos, errorMsg.find( "/nonexistent/logo.png" ) );
   EXPECT_TRUE( out.empty() );
}

TEST( rasterMode, names )
{
   rasterMode_t::type_e t ;
   ASSERT_TRUE( rasterMode_t::parse( "fast", t ) );
   EXPECT_EQ( rasterMode_t::fast, t );
   ASSERT_TRUE( rasterMode_t::parse( "threshold", t ) );
   EXPECT_EQ( rasterMode_t::threshold, t );
   EXPECT_FALSE( rasterMode_t::parse( "Dithered", t ) );
   EXPECT_STREQ( "dithered", rasterMode_t::typeName( rasterMode_t::dithered ) );
}
