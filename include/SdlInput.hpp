#pragma once

#include "InputEvent.hpp"
#ifdef _WIN32
#include <SDL.h>
#else
#include <SDL2/SDL.h>
#endif

namespace FlowPairs {

/**
 * TranslateEvent - Map one SDL event onto a backend-neutral InputEvent
 *
 * Key auto-repeat is dropped: a held key counts as a single press.
 * @return false if the event is not one the scenes react to
 */
bool TranslateEvent(const SDL_Event &event, InputEvent &out);

Key TranslateKey(SDL_Keycode sym);
MouseButton TranslateButton(Uint8 button);

} // namespace FlowPairs
