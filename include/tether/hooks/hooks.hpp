#pragma once

#include "tether/hooks/atom.hpp"
#include "tether/hooks/effect.hpp"
#include "tether/hooks/memo.hpp"
#include "tether/hooks/observe.hpp"
#include "tether/hooks/reaction.hpp"
#include "tether/hooks/reversible_atom.hpp"
#include "tether/hooks/state.hpp"
