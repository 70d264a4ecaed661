// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TaskFilter.hxx"
#include "lib/nlohmann_json/String.hxx"

namespace Reclaim {

using json = nlohmann::json;

bool
IsActiveTask(const json &task) noexcept
{
	if (!task.is_object())
		return false;

	if (const auto i = task.find("deleted");
	    i != task.end() && i->is_boolean() && i->get<bool>())
		return false;

	const auto status = Json::GetStringRobust(task, "status");
	return status != "ARCHIVED" && status != "CANCELLED";
}

json
FilterActiveTasks(const json &tasks)
{
	json result = json::array();
	if (!tasks.is_array())
		return result;

	for (const auto &task : tasks)
		if (IsActiveTask(task))
			result.push_back(task);

	return result;
}

} // namespace Reclaim
