/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __mybase_h__
#define __mybase_h__

#include "platform.h"
#include "macros.h"
#include "myfiler.h"
#include "mylimits.h"
#include "myexception.h"
#include "msg.h"

#endif//__mybase_h__
