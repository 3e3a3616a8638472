/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __CLOptions__
#define __CLOptions__

#include <string>
#include "macros.h"

// the OPER argument in the following macro represents operator along with 
// operand, e.g., `*0.01'.
#define DECLAREOPTION( NAME, TYPE, TYPECAST, OPER ) \
  extern TYPE val##NAME##_; \
  static inline TYPECAST Get##NAME() { return (TYPECAST)val##NAME##_ OPER; } \
  ; // void Read##NAME();

#define CLDECLAREOPTION( NAME, TYPE, TYPECAST, OPER ) \
    DECLAREOPTION( NAME, TYPE, TYPECAST, OPER ); \
    void AssignCLOpt##NAME( TYPE );

#define CLOPTASSIGN( NAME, VALUE ) \
    CLOptions::AssignCLOpt##NAME( VALUE );

//command-line options
namespace CLOptions {
//special values of options
enum {
    //take the process limit from the tool preset
    pplPresetLimit = -2,
    //use all available parallelism
    pplAllCPUs = -1,
    //no limit on the number of concurrent processes
    pplUnlimited = 0
};
//program options;
//P_, O_ for process and output options
CLDECLAREOPTION( P_PROCESS_LIMIT, int, int, );
CLDECLAREOPTION( P_POLL_INTERVAL, int, int, );
CLDECLAREOPTION( P_MAX_RECORDS, int, int, );
CLDECLAREOPTION( P_CAPTURE_STDERR, int, int, );
CLDECLAREOPTION( P_KEEP_TEMP, int, int, );
CLDECLAREOPTION( P_TMPDIR, std::string, std::string, );
CLDECLAREOPTION( O_PRECISION, int, int, );

//get the directory for temporary files: option value, environment 
//variable, or the default
std::string GetTemporaryDirectory();
}//namespace CLOptions

#endif//__CLOptions__
