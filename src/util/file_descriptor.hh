/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef FILE_DESCRIPTOR_HH
#define FILE_DESCRIPTOR_HH

#include <string>

/* RAII owner of a Unix file descriptor */
class FileDescriptor
{
private:
    int fd_;
    bool eof_;

    unsigned int read_count_, write_count_;

    /* attempt to write a portion of a string */
    std::string::const_iterator write( const std::string::const_iterator & begin,
                                       const std::string::const_iterator & end );

protected:
    void register_read( void ) { read_count_++; }
    void register_write( void ) { write_count_++; }
    void set_eof( void ) { eof_ = true; }

public:
    /* construct from fd number */
    explicit FileDescriptor( const int fd );

    /* move constructor */
    FileDescriptor( FileDescriptor && other );

    /* destructor */
    virtual ~FileDescriptor();

    /* accessors */
    const int & fd_num( void ) const { return fd_; }
    const bool & eof( void ) const { return eof_; }
    unsigned int read_count( void ) const { return read_count_; }
    unsigned int write_count( void ) const { return write_count_; }

    /* read up to limit bytes; an empty result means end of stream */
    std::string read( const size_t limit = BUFFER_SIZE );

    /* write the whole buffer */
    void write( const std::string & buffer );

    /* forbid copying FileDescriptor objects or assigning them */
    FileDescriptor( const FileDescriptor & other ) = delete;
    FileDescriptor & operator=( const FileDescriptor & other ) = delete;

    /* size of the buffer used by read() */
    static const size_t BUFFER_SIZE = 65535;
};

#endif /* FILE_DESCRIPTOR_HH */
