/// @file json.hpp
/// @brief nlohmann/json interoperability for collab-text.
///
/// Provides ADL serialization (to_json/from_json) for the wire types.
/// Identifiers are rendered as lowercase hex strings, so receivers can
/// order them with plain string comparison.

#pragma once

#include <collab-text/change.hpp>
#include <collab-text/identifier.hpp>
#include <collab-text/metadata.hpp>
#include <collab-text/patch.hpp>

#include <nlohmann/json.hpp>

namespace collab_text {

// -- Identity -----------------------------------------------------------------

void to_json(nlohmann::json& j, const Identifier& id);
/// @throws std::runtime_error if the string is not a well-formed identifier.
void from_json(const nlohmann::json& j, Identifier& id);

// -- Edits --------------------------------------------------------------------

/// `{"index": i, "remove": n, "text": "..."}`
void to_json(nlohmann::json& j, const Splice& s);
void from_json(const nlohmann::json& j, Splice& s);

/// `{"index": i, "removed": "...", "inserted": "..."}`
void to_json(nlohmann::json& j, const ChangePart& c);
void from_json(const nlohmann::json& j, ChangePart& c);

/// `{"removedIds": [...], "removedText": "...", "insertedIds": [...], "insertedText": "..."}`
void to_json(nlohmann::json& j, const PatchPart& p);
void from_json(const nlohmann::json& j, PatchPart& p);

// -- State --------------------------------------------------------------------

/// `{"ids": [...], "cemetery": {"<hex id>": count, ...}}`
void to_json(nlohmann::json& j, const Metadata& m);
void from_json(const nlohmann::json& j, Metadata& m);

}  // namespace collab_text
