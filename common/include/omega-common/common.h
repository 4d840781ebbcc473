#include "utils.h"
#include "format.h"

#ifndef OMEGA_COMMON_COMMON_H
#define OMEGA_COMMON_COMMON_H

#endif
