#ifndef MORK_MORK_H
#define MORK_MORK_H

#include "common.h"
#include "options.h"
#include "reader.h"
#include "slice.h"
#include "status.h"
#include "table.h"

#endif // MORK_MORK_H
