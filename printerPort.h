#ifndef __PRINTERPORT_H__
#define __PRINTERPORT_H__ "$Id$"

/*
 * printerPort.h
 *
 * This header file declares the printerPort_t interface,
 * which delivers a finished print job to a printer, and
 * devicePort_t, which writes it to a device node or file:
 *
 *    /dev/usb/lp0      - USB printer class
 *    /dev/rfcomm0      - Bluetooth serial
 *    /dev/ttyS1        - serial (set the baud rate elsewhere)
 *    receipt.bin       - capture file
 *    -                 - standard output
 *
 * Data is written in chunks of at most chunkSize bytes.
 * A short or failed write is reported, not retried.
 *
 * Change History :
 *
 * $Log$
 *
 *
 * Copyright Boundary Devices, Inc. 2007
 */

#include <string>

class printerPort_t {
public:
   virtual ~printerPort_t( void ){}

   virtual bool write( void const   *data,
                       unsigned long length,
                       std::string  &errorMsg ) = 0 ;
};

class devicePort_t : public printerPort_t {
public:
   enum {
      defaultChunkSize = 512
   };

   devicePort_t( char const *path, unsigned chunkSize = defaultChunkSize );
   virtual ~devicePort_t( void );

   // call before write(). getError() if !isOpen
   inline bool isOpen( void ) const { return 0 <= fd_ ; }
   char const *getError( void ) const ;

   virtual bool write( void const   *data,
                       unsigned long length,
                       std::string  &errorMsg );

   inline unsigned long bytesWritten( void ) const { return bytesWritten_ ; }

private:
   devicePort_t( devicePort_t const & ); // no copies
   devicePort_t &operator=( devicePort_t const & );

   std::string const path_ ;
   unsigned const    chunkSize_ ;
   int               fd_ ;
   bool              ownFd_ ;
   int               errno_ ;
   unsigned long     bytesWritten_ ;
};

#endif

