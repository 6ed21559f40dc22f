#pragma once

// Injected by CMake via -DKOOKBRIDGE_VERSION_STRING=..., fallback to a default.
#ifndef KOOKBRIDGE_VERSION_STRING
#define KOOKBRIDGE_VERSION_STRING "0.1.0-dev"
#endif
