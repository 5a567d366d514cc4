/// @file collab_text.hpp
/// @brief Umbrella header for the collab-text library.
///
/// Include this single header for access to all public types:
/// TextField, Replica, Identifier, IdAllocator, Metadata, Cemetery,
/// Splice, ChangePart, PatchPart, the binary codec and Error.

#pragma once

#include <collab-text/cemetery.hpp>
#include <collab-text/change.hpp>
#include <collab-text/codec.hpp>
#include <collab-text/error.hpp>
#include <collab-text/id_allocator.hpp>
#include <collab-text/identifier.hpp>
#include <collab-text/log.hpp>
#include <collab-text/metadata.hpp>
#include <collab-text/patch.hpp>
#include <collab-text/replica.hpp>
#include <collab-text/text_field.hpp>
