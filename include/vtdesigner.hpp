#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "vtdesigner/core/constants.hpp"
#include "vtdesigner/core/error.hpp"
#include "vtdesigner/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "vtdesigner/util/file_io.hpp"
#include "vtdesigner/util/iop_parser.hpp"
#include "vtdesigner/util/mailbox.hpp"

// ─── Virtual Terminal object model ───────────────────────────────────────────
#include "vtdesigner/vt/events.hpp"
#include "vtdesigner/vt/object_defaults.hpp"
#include "vtdesigner/vt/object_pool.hpp"
#include "vtdesigner/vt/objects.hpp"
#include "vtdesigner/vt/relationships.hpp"

// ─── Editor ──────────────────────────────────────────────────────────────────
#include "vtdesigner/editor/hierarchy.hpp"
#include "vtdesigner/editor/id_allocator.hpp"
#include "vtdesigner/editor/naming.hpp"
#include "vtdesigner/editor/object_info.hpp"
#include "vtdesigner/editor/project.hpp"
#include "vtdesigner/editor/project_config.hpp"
#include "vtdesigner/editor/project_file.hpp"
#include "vtdesigner/editor/session.hpp"
