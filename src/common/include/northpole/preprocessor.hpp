#pragma once

// Macro to stringify its argument (adding double quotes).
#define NORTHPOLE_STRINGIFY_NX(x) #x

// Macro to force expansion before stringifying.
#define NORTHPOLE_STRINGIFY(x) NORTHPOLE_STRINGIFY_NX(x)
