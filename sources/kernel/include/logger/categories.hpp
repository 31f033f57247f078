#pragma once

#include "logger/logger.hpp"

constinit inline cm::Logger BootLog { "BOOT" };
constinit inline cm::Logger MemLog { "MEM" };
constinit inline cm::Logger HandoffLog { "HANDOFF" };
constinit inline cm::Logger InitLog { "INIT" };
