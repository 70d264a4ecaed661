// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Task.hxx"

namespace Reclaim {

struct AccountDefaults;
struct ResolutionContext;

enum class TaskFlow {
	/**
	 * Create a task; the Reclaim scheduler picks the time.
	 */
	CREATE,

	/**
	 * Create a task at an explicit start time.
	 */
	CREATE_AT_TIME,

	/**
	 * Patch an existing task; only explicit fields are sent.
	 */
	UPDATE,
};

/**
 * Convert the caller's task fields to the form expected by the
 * Reclaim API: minutes become chunks, gaps are filled from the
 * account defaults (create flows only), chunk bounds are clamped to
 * the total, date fields are resolved to UTC and enumerated values
 * are canonicalized.
 *
 * This is all-or-nothing: it either returns the complete field set
 * or throws.
 *
 * Throws #InvalidInput, #InvalidTimezone or #ChunkSizeConflict.
 */
NormalizedTask
Normalize(const TaskInput &input, const AccountDefaults &defaults,
	  const ResolutionContext &context, TaskFlow flow);

} // namespace Reclaim
