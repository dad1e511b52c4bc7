/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef TIMESTAMP_HH
#define TIMESTAMP_HH

#include <cstdint>

/* wall-clock milliseconds since the Unix epoch */
uint64_t timestamp( void );

#endif /* TIMESTAMP_HH */
