#pragma once

/**
 * Conduit C++ Library
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "conduit/errors.hpp"

// Helper utilities
#include "conduit/helpers.hpp"
#include "conduit/env.hpp"
#include "conduit/logging.hpp"

// Validation helpers
#include "conduit/validation.hpp"

// Workflow aggregate
#include "conduit/workflow_state.hpp"
#include "conduit/workflow.hpp"
#include "conduit/builder.hpp"

// Subject routing
#include "conduit/channel.hpp"
#include "conduit/subjects.hpp"
#include "conduit/sequence_tracker.hpp"
#include "conduit/subject_router.hpp"
#include "conduit/subject_consumer.hpp"
#include "conduit/event_sequencer.hpp"

// Persistence port and command pipeline
#include "conduit/event_store.hpp"
#include "conduit/command_handler.hpp"
