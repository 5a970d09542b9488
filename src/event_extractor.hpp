#pragma once

#include "extraction_context.hpp"
#include "game_events.hpp"
#include "json_block.hpp"
#include <optional>
#include <vector>

namespace arena_tracker {

// Identity of a game object after walking the newId -> origId remap chain
struct ResolvedInstance {
    int instance_id = 0;   // id at which the grpId was found
    int grp_id = 0;
    int owner_seat_id = 0;
};

// Follows ObjectIdChanged/Shuffle remaps until an id with a known grpId is
// found. Terminates on cycles.
std::optional<ResolvedInstance> resolve_identity(int instance_id, const ExtractionContext& ctx);

// Decodes one block into domain events, updating ctx.
std::vector<ArenaGameEvent> extract_events(const JsonBlock& block, ExtractionContext& ctx);

// Decodes a batch. Mulligan hands revealed later in the batch are written
// back into prompts emitted earlier in the same batch.
std::vector<ArenaGameEvent> extract_events(const std::vector<JsonBlock>& blocks, ExtractionContext& ctx);

} // namespace arena_tracker
