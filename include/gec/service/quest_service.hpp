#pragma once

/// @file quest_service.hpp
/// @brief Quest completion with requirement checks and quest points.

#include "gec/foundation/game_result.hpp"
#include "gec/service/catalog.hpp"
#include "gec/service/engine_events.hpp"
#include "gec/service/player_store.hpp"

namespace gec::service {

class QuestService {
public:
    QuestService(PlayerStore& players, const Catalog& catalog);

    /// Mark @p quest completed and add its quest points.
    /// @return true on first completion, false if it was already completed.
    [[nodiscard]] foundation::GameResult<bool> completeQuest(foundation::PlayerId player,
                                                             foundation::QuestId quest);

    /// Stage a completion inside an existing unit of work.
    [[nodiscard]] foundation::GameResult<bool> stageCompletion(game::PlayerState& state,
                                                               const game::QuestDefinition& quest,
                                                               foundation::Timestamp at);

    [[nodiscard]] QuestCompletedSignal& onQuestCompleted() noexcept { return questCompleted_; }

private:
    PlayerStore& players_;
    const Catalog& catalog_;
    QuestCompletedSignal questCompleted_;
};

}  // namespace gec::service
