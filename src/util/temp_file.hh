/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef TEMP_FILE_HH
#define TEMP_FILE_HH

#include <string>
#include <vector>

#include "file_descriptor.hh"

/* a newly created file with a unique name, opened for writing */
class UniqueFile
{
private:
    std::vector<char> mutable_temp_filename_;
    FileDescriptor fd_;

public:
    /* the file is created as PREFIX.XXXXXX */
    UniqueFile( const std::string & filename_prefix );

    std::string name( void ) const;

    void write( const std::string & contents );

    /* ban copying */
    UniqueFile( const UniqueFile & other ) = delete;
    UniqueFile & operator=( const UniqueFile & other ) = delete;
};

#endif /* TEMP_FILE_HH */
