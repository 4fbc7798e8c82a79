/*
 * Module memFileTest.cpp
 *
 * This module tests the memFile_t class for mapped and
 * read-in files
 *
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */


#include "memFile.h"
#include <gtest/gtest.h>
#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <errno.h>

class memFileTmp : public ::testing::Test {
protected:
   virtual void SetUp( void )
   {
      strcpy( name_, "/tmp/memFileXXXXXX" );
      fd_ = mkstemp( name_ );
      ASSERT_LE( 0, fd_ );
   }
   virtual void TearDown( void )
   {
      close( fd_ );
      unlink( name_ );
   }

   void put( char const *s )
   {
      ASSERT_EQ( (ssize_t)strlen( s ), write( fd_, s, strlen( s ) ) );
   }

   char name_[64];
   int  fd_ ;
};

TEST_F( memFileTmp, regularFileIsMapped )
{
   put( "logo bytes" );
   memFile_t fIn( name_ );
   ASSERT_TRUE( fIn.worked() ) << fIn.getError();
   EXPECT_TRUE( fIn.isMapped() );
   ASSERT_EQ( 10u, fIn.getLength() );
   EXPECT_EQ( 0, memcmp( "logo bytes", fIn.getData(), 10 ) );
}

TEST_F( memFileTmp, emptyFileFails )
{
   memFile_t fIn( name_ );
   EXPECT_FALSE( fIn.worked() );
   EXPECT_STREQ( strerror( EINVAL ), fIn.getError() );
}

TEST_F( memFileTmp, tooLongFails )
{
   put( "0123456789" );
   memFile_t fIn( name_, 9 );
   EXPECT_FALSE( fIn.worked() );
   EXPECT_STREQ( strerror( EFBIG ), fIn.getError() );

   memFile_t fits( name_, 10 );
   EXPECT_TRUE( fits.worked() );
}

TEST( memFile, unmappableIsRead )
{
   // procfs reports a zero size for files that have content
   memFile_t fIn( "/proc/self/stat" );
   ASSERT_TRUE( fIn.worked() ) << fIn.getError();
   EXPECT_FALSE( fIn.isMapped() );
   EXPECT_LT( 0u, fIn.getLength() );
}

TEST( memFile, missingFile )
{
   memFile_t fIn( "/nonexistent/logo.png" );
   EXPECT_FALSE( fIn.worked() );
   EXPECT_STREQ( strerror( ENOENT ), fIn.getError() );
   EXPECT_TRUE( 0 == fIn.getData() );
}
