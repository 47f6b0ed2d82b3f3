#pragma once

// Centralized SDL include for the graphical front-end. The simulation core
// never includes this header.
//
// SDL_MAIN_HANDLED keeps SDL from redefining main() as SDL_main, so we do not
// need to link SDLmain. main() calls SDL_SetMainReady() before SDL_Init().
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
