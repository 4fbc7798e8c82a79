#ifndef __MEMFILE_H__
#define __MEMFILE_H__ "$Id$"

/*
 * memFile.h
 *
 * This header file declares the memFile_t class, which is
 * used to bring a whole file (normally a logo image) into
 * memory so that its content can be handed to a decoder in
 * one piece.
 *
 * Regular files are mmap'd. Anything that can't be mapped
 * (pipes, /dev/stdin, /proc entries) is read into a buffer.
 *
 * Empty input is reported as a failure (EINVAL), since
 * there's nothing useful to decode, and input longer than
 * maxLength fails with EFBIG.
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

class memFile_t {
public:
   enum {
      defaultMaxLength = 16<<20
   };

   memFile_t( char const   *path,
              unsigned long maxLength = defaultMaxLength );
   ~memFile_t( void );

   inline bool worked( void ) const { return 0 != data_ ; }

   // call if !worked
   char const *getError( void ) const ;

   inline void const *getData( void ) const { return data_ ; }
   inline unsigned long getLength( void ) const { return length_ ; }
   inline bool isMapped( void ) const { return mapped_ ; }

private:
   memFile_t( memFile_t const & ); // no copies
   memFile_t &operator=( memFile_t const & );

   bool map( int fd, unsigned long size );
   bool slurp( int fd, unsigned long maxLength );

   void const   *data_ ;
   unsigned long length_ ;
   bool          mapped_ ;
   int           errno_ ;
};


#endif

