// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <nlohmann/json.hpp>

namespace Reclaim {

/**
 * Is this task "active", i.e. not deleted and neither ARCHIVED nor
 * CANCELLED?  Note that a COMPLETE task is active: that status only
 * means its scheduled time has been used up.
 */
[[gnu::pure]]
bool
IsActiveTask(const nlohmann::json &task) noexcept;

/**
 * Return a new array with only the active tasks.  Anything but an
 * array yields an empty array.
 */
nlohmann::json
FilterActiveTasks(const nlohmann::json &tasks);

} // namespace Reclaim
