/*
 * Module commandStreamTest.cpp
 *
 * This module tests the commandStream_t class
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "commandStream.h"
#include <gtest/gtest.h>
#include <string.h>

TEST( commandStream, flattensInOrder )
{
   unsigned char const init[] = { 0x1B, 0x40 };
   std::vector<unsigned char> cut ;
   cut.push_back( 0x1D );
   cut.push_back( 0x56 );
   cut.push_back( 0x00 );

   commandStream_t stream ;
   stream.add( init, sizeof( init ) );
   stream.add( "hello\n" );
   stream.add( std::string( "world\n" ) );
   stream.add( cut );

   ASSERT_EQ( 4u, stream.segmentCount() );
   EXPECT_EQ( commandStream_t::binary, stream.segmentType( 0 ) );
   EXPECT_EQ( commandStream_t::text, stream.segmentType( 1 ) );
   EXPECT_EQ( 6ul, stream.segmentLength( 2 ) );
   EXPECT_EQ( 2ul + 6ul + 6ul + 3ul, stream.totalLength() );

   std::vector<unsigned char> out ;
   ASSERT_TRUE( stream.flatten( out ) );
   ASSERT_EQ( 17u, out.size() );
   EXPECT_EQ( 0x1B, out[0] );
   EXPECT_EQ( 0, memcmp( &out[2], "hello\nworld\n", 12 ) );
   EXPECT_EQ( 0x00, out[16] );
}

TEST( commandStream, lengthIsSumOfSegments )
{
   commandStream_t stream ;
   unsigned long sum = 0 ;
   for( unsigned i = 0 ; i < 50 ; i++ )
   {
      std::string s( i, 'x' );
      stream.add( s );
      sum += i ;
   }
   unsigned long counted = 0 ;
   for( unsigned i = 0 ; i < stream.segmentCount(); i++ )
      counted += stream.segmentLength( i );
   EXPECT_EQ( sum, counted );

   std::vector<unsigned char> out ;
   ASSERT_TRUE( stream.flatten( out ) );
   EXPECT_EQ( sum, out.size() );
}

TEST( commandStream, flattensOnlyOnce )
{
   commandStream_t stream ;
   stream.add( "abc" );
   std::vector<unsigned char> out ;
   ASSERT_TRUE( stream.flatten( out ) );
   EXPECT_TRUE( stream.flattened() );
   EXPECT_FALSE( stream.flatten( out ) );
   EXPECT_TRUE( out.empty() );
}

TEST( commandStream, emptySegmentsCount )
{
   commandStream_t stream ;
   stream.add( "" );
   stream.add( 0, 0 );
   stream.add( std::vector<unsigned char>() );
   EXPECT_EQ( 3u, stream.segmentCount() );
   EXPECT_EQ( 0ul, stream.totalLength() );

   std::vector<unsigned char> out( 5 );
   ASSERT_TRUE( stream.flatten( out ) );
   EXPECT_TRUE( out.empty() );
}

TEST( commandStream, appendCopiesSegments )
{
   commandStream_t head, tail ;
   head.add( "A" );
   tail.add( "BC" );
   tail.add( "D" );
   head.append( tail );
   EXPECT_EQ( 3u, head.segmentCount() );
   EXPECT_EQ( 2u, tail.segmentCount() );

   std::vector<unsigned char> out ;
   ASSERT_TRUE( head.flatten( out ) );
   EXPECT_EQ( std::string( "ABCD" ), std::string( out.begin(), out.end() ) );
}
