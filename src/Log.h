//
// Log.h - SDL log wrappers shared by the library
//

#ifndef HEXKIT_LOG_H
#define HEXKIT_LOG_H

#include <SDL3/SDL_log.h>

#define LogError(...) (SDL_LogError(SDL_LOG_CATEGORY_ERROR, __VA_ARGS__))
#define LogWarn(...) (SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, __VA_ARGS__))
#define LogInfo(...) (SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, __VA_ARGS__))
#define LogDebug(...) (SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, __VA_ARGS__))

#endif // HEXKIT_LOG_H
