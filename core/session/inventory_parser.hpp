#pragma once

#include <string>
#include <vector>

namespace tale {

// ─── Inventory Parser ──────────────────────────────────────────
// Turns engine item descriptors into short display names. Descriptors
// are the engine's debug rendering of an object, e.g.
//   "Obj68: leaflet Parent67 Sibling0 Child0 Attributes [] ..."
// Precedence:
//   1. contains "parent" (any case): keep the text before it, then the
//      text after its first colon if it has one
//   2. contains a colon: keep the text after the first colon
//   3. otherwise the descriptor is returned unchanged
// Best effort only. Descriptors of other shapes yield imperfect names.

std::string parseItemName(const std::string& descriptor);

/// parseItemName() over a whole inventory, preserving order.
std::vector<std::string> parseInventory(const std::vector<std::string>& descriptors);

} // namespace tale
