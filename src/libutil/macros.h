/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __macros_h__
#define __macros_h__

#define STR( arg )                  #arg
#define TOSTR( arg )                STR( arg )

#define PCMIN( a, b )   (( a ) < ( b ) ? ( a ) : ( b ))
#define PCMAX( a, b )   (( a ) > ( b ) ? ( a ) : ( b ))

//number of elements of a static array
#define ARRAYLEN( arr ) ( sizeof( arr ) / sizeof( arr[0] ))

#endif//__macros_h__
