#pragma once

/// @file gec.hpp
/// @brief Umbrella header for the game economy engine.

#include "gec/version.hpp"
#include "gec/core/result.hpp"

#include "gec/foundation/config_manager.hpp"
#include "gec/foundation/error_code.hpp"
#include "gec/foundation/game_error.hpp"
#include "gec/foundation/game_logger.hpp"
#include "gec/foundation/game_result.hpp"
#include "gec/foundation/signal.hpp"
#include "gec/foundation/types.hpp"

#include "gec/game/achievement_types.hpp"
#include "gec/game/battle_types.hpp"
#include "gec/game/derived_stats.hpp"
#include "gec/game/experience_table.hpp"
#include "gec/game/item_types.hpp"
#include "gec/game/order_book.hpp"
#include "gec/game/order_types.hpp"
#include "gec/game/player_state.hpp"
#include "gec/game/rating_calculator.hpp"
#include "gec/game/requirement.hpp"
#include "gec/game/skill_types.hpp"
#include "gec/game/tournament_types.hpp"

#include "gec/service/economy_engine.hpp"
