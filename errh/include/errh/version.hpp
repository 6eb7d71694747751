// clang-format off
#pragma once

#define ERRH_VERSION_CODE( major, minor, patch ) \
    ( ( ( major ) << 16UL ) + ( ( minor ) << 8UL ) + ( ( patch ) << 0UL ))

#define ERRH_VERSION_MAJOR 0ull
#define ERRH_VERSION_MINOR 1ull
#define ERRH_VERSION_PATCH 0ull

#if !defined(ERRH_VCS_REVISION)
    #define ERRH_VCS_REVISION "n/a"
#endif

#define ERRH_VERSION \
    ERRH_VERSION_CODE( ERRH_VERSION_MAJOR, ERRH_VERSION_MINOR, ERRH_VERSION_PATCH )
