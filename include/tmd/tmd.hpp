#pragma once

/**
 * TMD
 *
 * Markdown documents bundled with a manifest, binary attachments and an
 * embedded SQLite database, stored as .tmd (Markdown prefix + ZIP) or
 * .tmdz (ZIP only).
 */

#include <tmd/types.hpp>
#include <tmd/document.hpp>
#include <tmd/codec/container.hpp>
