#pragma once

#include <stdint.h>
#include <stddef.h>

#if CM_HOSTED
#   include "arch/hosted/intrin.hpp"
#elif defined(__x86_64__)
#   include "arch/x86_64/intrin.hpp"
#else
#   error "Unsupported architecture"
#endif
