// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ToolHandler.hxx"
#include "JsonRpc.hxx"
#include "ToolResult.hxx"
#include "reclaim/AccountCache.hxx"
#include "reclaim/Error.hxx"
#include "reclaim/Normalizer.hxx"
#include "reclaim/RecordService.hxx"
#include "reclaim/Resolver.hxx"
#include "reclaim/TaskFilter.hxx"
#include "lib/nlohmann_json/String.hxx"

#include <fmt/format.h>

#include <limits>
#include <optional>
#include <stdexcept>

namespace Mcp {

using json = nlohmann::json;
using namespace Reclaim;

static constexpr const char *list_status_note =
	"IMPORTANT NOTE: A task with 'status: COMPLETE' has NOT been marked done by the user; "
	"it has only used up the time initially scheduled for it. "
	"When asked for all tasks or all active tasks, include the COMPLETE ones "
	"unless the user says otherwise.";

static constexpr const char *get_status_note =
	"Note: 'status: COMPLETE' does NOT mean the user has finished this task; "
	"finished tasks are ARCHIVED or CANCELLED.  A COMPLETE task is still active.";

/* JSON schema helpers */

static json
StringProperty(const char *description)
{
	return {{"type", "string"}, {"description", description}};
}

static json
PositiveIntegerProperty(const char *description)
{
	return {
		{"type", "integer"},
		{"minimum", 1},
		{"description", description},
	};
}

static json
BooleanProperty(const char *description)
{
	return {{"type", "boolean"}, {"description", description}};
}

static json
DateProperty(const char *description)
{
	return {
		{"anyOf", json::array({
					{{"type", "integer"}, {"minimum", 1}},
					{{"type", "string"}},
				})},
		{"description", description},
	};
}

static json
MakeObjectSchema(json &&properties, std::initializer_list<const char *> required={})
{
	json schema{
		{"type", "object"},
		{"properties", std::move(properties)},
	};

	if (required.size() > 0) {
		json r = json::array();
		for (const char *i : required)
			r.push_back(i);
		schema["required"] = std::move(r);
	}

	return schema;
}

static json
TaskIdProperty()
{
	return PositiveIntegerProperty("The unique ID of the task.");
}

static json
TaskIdSchema()
{
	return MakeObjectSchema({{"taskId", TaskIdProperty()}}, {"taskId"});
}

static json
EmptySchema()
{
	return MakeObjectSchema(json::object());
}

static json
TaskProperties()
{
	return {
		{"title", {{"type", "string"}, {"minLength", 1},
			   {"description", "The task title."}}},
		{"notes", StringProperty("Free-form notes.")},
		{"eventCategory", StringProperty("WORK or PERSONAL.")},
		{"eventSubType", StringProperty("e.g. FOCUS, STAFF_MEETING (\"meeting\"), ONE_ON_ONE, ERRAND, HEALTH.")},
		{"priority", StringProperty("P1 (critical) to P4 (low).")},
		{"timeChunksRequired", PositiveIntegerProperty("Total task duration in 15-minute chunks (e.g. 60 minutes = 4 chunks).")},
		{"durationMinutes", PositiveIntegerProperty("Total task duration in minutes; must be a multiple of 15.")},
		{"minChunkSize", PositiveIntegerProperty("Minimum chunk size in 15-minute chunks.")},
		{"minDurationMinutes", PositiveIntegerProperty("Minimum chunk duration in minutes; must be a multiple of 15.")},
		{"maxChunkSize", PositiveIntegerProperty("Maximum chunk size in 15-minute chunks.")},
		{"maxDurationMinutes", PositiveIntegerProperty("Maximum chunk duration in minutes; must be a multiple of 15.")},
		{"lockChunkSizeToDuration", BooleanProperty("If true, the task is scheduled in one piece (minimum and maximum chunk size equal the duration).")},
		{"onDeck", BooleanProperty("Schedule this task next.")},
		{"alwaysPrivate", BooleanProperty("Make the calendar event private.")},
		{"timeSchemeId", StringProperty("The scheduling hours to use.")},
		{"status", {
				{"type", "string"},
				{"enum", json::array({"NEW", "SCHEDULED", "IN_PROGRESS",
						      "COMPLETE", "CANCELLED", "ARCHIVED"})},
			}},
		{"deadline", DateProperty("Number of days from now, YYYY-MM-DD, or an ISO 8601 date/time (with or without offset).")},
		{"snoozeUntil", DateProperty("Do not schedule before this time: number of days from now, YYYY-MM-DD, or an ISO 8601 date/time.")},
		{"startTime", StringProperty("Place the task at this time (ISO 8601, with or without offset).")},
		{"timeZone", StringProperty("IANA time zone used to interpret date/time inputs without offset (e.g. America/Los_Angeles).")},
		{"timezone", StringProperty("Alias for timeZone.")},
		{"eventColor", StringProperty("LAVENDER, SAGE, GRAPE, FLAMINGO, BANANA, TANGERINE, PEACOCK, GRAPHITE, BLUEBERRY, BASIL or TOMATO.")},
	};
}

static json
CreateTaskSchema()
{
	return MakeObjectSchema(TaskProperties(), {"title"});
}

static json
UpdateTaskSchema()
{
	json properties = TaskProperties();
	properties.erase("startTime");
	properties["taskId"] = TaskIdProperty();
	return MakeObjectSchema(std::move(properties), {"taskId"});
}

static json
ListTasksSchema()
{
	return MakeObjectSchema({
			{"filter", {
					{"type", "string"},
					{"enum", json::array({"active", "all"})},
					{"default", "active"},
					{"description", "\"active\" (default): tasks which are not deleted, ARCHIVED or CANCELLED; \"all\": all tasks."},
				}},
		});
}

static json
AddTimeSchema()
{
	return MakeObjectSchema({
			{"taskId", TaskIdProperty()},
			{"minutes", PositiveIntegerProperty("Number of minutes to add to the task schedule.")},
		}, {"taskId", "minutes"});
}

static json
LogWorkSchema()
{
	return MakeObjectSchema({
			{"taskId", TaskIdProperty()},
			{"minutes", PositiveIntegerProperty("Number of minutes worked.")},
			{"end", StringProperty("End of the work session (ISO 8601 or YYYY-MM-DD); defaults to now.")},
			{"timeZone", StringProperty("IANA time zone used to interpret \"end\" without offset.")},
			{"timezone", StringProperty("Alias for timeZone.")},
		}, {"taskId", "minutes"});
}

struct ToolDefinition {
	const char *name;
	const char *title;
	const char *description;
	json (*make_schema)();
	bool read_only, idempotent, destructive;
};

static constexpr ToolDefinition tools[] = {
	{"reclaim_get_task_defaults", "Get Reclaim Task Defaults",
	 "Fetch account-level Reclaim task defaults (chunk sizes, priority defaults, etc.).",
	 EmptySchema, true, true, false},
	{"reclaim_list_tasks", "List Reclaim Tasks",
	 "List Reclaim.ai tasks, optionally only the active ones (not deleted, ARCHIVED or CANCELLED).",
	 ListTasksSchema, true, true, false},
	{"reclaim_get_task", "Get Reclaim Task",
	 "Fetch details for a specific Reclaim.ai task by its ID.",
	 TaskIdSchema, true, true, false},
	{"reclaim_create_task", "Create Reclaim Task",
	 "Create a new task in Reclaim.ai.",
	 CreateTaskSchema, false, false, false},
	{"reclaim_update_task", "Update Reclaim Task",
	 "Update one or more fields on an existing Reclaim.ai task.",
	 UpdateTaskSchema, false, true, false},
	{"reclaim_delete_task", "Delete Reclaim Task",
	 "Permanently delete a specific Reclaim.ai task.",
	 TaskIdSchema, false, true, true},
	{"reclaim_mark_complete", "Mark Reclaim Task Complete",
	 "Mark a specific Reclaim.ai task as done by the user.",
	 TaskIdSchema, false, true, false},
	{"reclaim_mark_incomplete", "Mark Reclaim Task Incomplete",
	 "Mark a specific Reclaim.ai task as incomplete (unarchive it).",
	 TaskIdSchema, false, true, false},
	{"reclaim_add_time", "Add Time to Reclaim Task",
	 "Add scheduled time (in minutes) to a specific Reclaim.ai task.",
	 AddTimeSchema, false, false, false},
	{"reclaim_start_timer", "Start Reclaim Task Timer",
	 "Start the live timer for a specific Reclaim.ai task.",
	 TaskIdSchema, false, true, false},
	{"reclaim_stop_timer", "Stop Reclaim Task Timer",
	 "Stop the live timer for a specific Reclaim.ai task.",
	 TaskIdSchema, false, true, false},
	{"reclaim_log_work", "Log Work for Reclaim Task",
	 "Log completed work time (in minutes) against a specific Reclaim.ai task.",
	 LogWorkSchema, false, false, false},
	{"reclaim_clear_exceptions", "Clear Reclaim Task Exceptions",
	 "Clear any scheduling exceptions for a specific Reclaim.ai task.",
	 TaskIdSchema, false, true, false},
	{"reclaim_prioritize", "Prioritize Reclaim Task",
	 "Mark a specific Reclaim.ai task for prioritization in the planner.",
	 TaskIdSchema, false, true, false},
};

[[gnu::pure]]
static const ToolDefinition *
FindTool(std::string_view name) noexcept
{
	for (const auto &i : tools)
		if (name == i.name)
			return &i;

	return nullptr;
}

struct PlannerTool {
	const char *name;
	PlannerAction action;
};

static constexpr PlannerTool planner_tools[] = {
	{"reclaim_mark_complete", PlannerAction::DONE},
	{"reclaim_mark_incomplete", PlannerAction::UNARCHIVE},
	{"reclaim_start_timer", PlannerAction::START},
	{"reclaim_stop_timer", PlannerAction::STOP},
	{"reclaim_clear_exceptions", PlannerAction::CLEAR_EXCEPTIONS},
	{"reclaim_prioritize", PlannerAction::PRIORITIZE},
};

[[gnu::pure]]
static const PlannerTool *
FindPlannerTool(std::string_view name) noexcept
{
	for (const auto &i : planner_tools)
		if (name == i.name)
			return &i;

	return nullptr;
}

/* argument helpers */

static uint_least64_t
GetPositiveArgument(const json &args, const char *name)
{
	const auto i = args.find(name);
	if (i != args.end() && i->is_number_integer() &&
	    i->get<int64_t>() > 0)
		return i->get<uint_least64_t>();

	throw InvalidInput(fmt::format("{} must be a positive integer.", name));
}

static TaskId
GetTaskId(const json &args)
{
	return GetPositiveArgument(args, "taskId");
}

static unsigned
GetMinutes(const json &args, const char *what)
{
	const auto i = args.find("minutes");
	if (i == args.end() || !i->is_number())
		throw InvalidInput("minutes must be a positive integer.");

	if (!i->is_number_integer() || i->get<int64_t>() <= 0)
		throw InvalidInput(fmt::format("Minutes must be positive to {}.",
					       what));

	if (i->get<int64_t>() > std::numeric_limits<unsigned>::max())
		throw InvalidInput("minutes is too large.");

	return i->get<unsigned>();
}

static std::string
GetTimeZoneArgument(const json &args)
{
	if (auto tz = Json::GetStringRobust(args, "timeZone"); !tz.empty())
		return std::string{tz};

	return std::string{Json::GetStringRobust(args, "timezone")};
}

ToolHandler::ToolHandler(RecordService &_service, AccountCache &_account,
			 std::string_view _default_time_zone,
			 Clock _clock) noexcept
	:service(_service), account(_account),
	 default_time_zone(_default_time_zone),
	 clock(_clock)
{
}

json
ToolHandler::ListTools()
{
	json result = json::array();

	for (const auto &i : tools)
		result.push_back({
				{"name", i.name},
				{"title", i.title},
				{"description", i.description},
				{"inputSchema", i.make_schema()},
				{"annotations", {
						{"readOnlyHint", i.read_only},
						{"idempotentHint", i.idempotent},
						{"destructiveHint", i.destructive},
					}},
			});

	return {{"tools", std::move(result)}};
}

Co::Task<ResolutionContext>
ToolHandler::MakeContext(std::string time_zone)
{
	ResolutionContext context;
	context.time_zone = std::move(time_zone);
	context.default_time_zone = default_time_zone;
	context.now = clock();

	if (context.GetTimeZoneName().empty()) {
		/* only consult the account if nothing more specific
		   is configured */
		const auto defaults = co_await account.GetOrEmpty();
		context.account_time_zone = defaults.time_zone;
	}

	co_return context;
}

Co::Task<json>
ToolHandler::GetTaskDefaults()
{
	const auto defaults = co_await account.Get();
	co_return defaults.ToJson();
}

Co::Task<json>
ToolHandler::ListTasks(const json &args)
{
	std::string_view filter = Json::GetStringRobust(args, "filter");
	if (filter.empty())
		filter = "active";
	else if (filter != "active" && filter != "all")
		throw InvalidInput("filter must be \"active\" or \"all\".");

	auto tasks = co_await service.ListTasks();
	if (filter == "active")
		tasks = FilterActiveTasks(tasks);

	co_return tasks;
}

Co::Task<json>
ToolHandler::GetTask(const json &args)
{
	co_return co_await service.GetTask(GetTaskId(args));
}

Co::Task<json>
ToolHandler::CreateTask(const json &args)
{
	auto input = TaskInput::FromJson(args);
	if (input.start_time && input.start_time->empty())
		input.start_time.reset();

	const auto defaults = co_await account.GetOrEmpty();
	auto context = co_await MakeContext(input.time_zone);

	const auto flow = input.start_time
		? TaskFlow::CREATE_AT_TIME
		: TaskFlow::CREATE;
	const auto task = Normalize(input, defaults, context, flow);

	if (task.start_time)
		co_return co_await service.CreateTaskAtTime(*task.start_time,
							    task.ToJson());
	else
		co_return co_await service.CreateTask(task.ToJson());
}

Co::Task<json>
ToolHandler::UpdateTask(const json &args)
{
	const TaskId id = GetTaskId(args);

	auto input = TaskInput::FromJson(args);

	/* a start time cannot be changed here */
	input.start_time.reset();

	auto context = co_await MakeContext(input.time_zone);
	const auto task = Normalize(input, AccountDefaults{}, context,
				    TaskFlow::UPDATE);

	co_return co_await service.UpdateTask(id, task.ToJson());
}

Co::Task<json>
ToolHandler::DeleteTask(const json &args)
{
	co_await service.DeleteTask(GetTaskId(args));
	co_return json{{"success", true}};
}

Co::Task<json>
ToolHandler::AddTime(const json &args)
{
	const TaskId id = GetTaskId(args);
	const unsigned minutes = GetMinutes(args, "add time");
	co_return co_await service.AddTime(id, minutes);
}

Co::Task<json>
ToolHandler::LogWork(const json &args)
{
	const TaskId id = GetTaskId(args);
	const unsigned minutes = GetMinutes(args, "log work");

	std::optional<std::string> end;
	if (const auto e = Json::GetStringRobust(args, "end"); !e.empty()) {
		const auto context = co_await MakeContext(GetTimeZoneArgument(args));

		try {
			end = ResolveToString(std::string{e}, context);
		} catch (const InvalidTimezone &) {
			throw;
		} catch (const InvalidInput &error) {
			throw InvalidInput(fmt::format("Invalid 'end' date format: \"{}\". Error: {}. Please use ISO 8601 or YYYY-MM-DD format.",
						       e, error.what()));
		}
	}

	co_return co_await service.LogWork(id, minutes, std::move(end));
}

Co::Task<json>
ToolHandler::Invoke(std::string_view name, const json &args)
{
	if (const auto *p = FindPlannerTool(name))
		co_return co_await service.Plan(p->action, GetTaskId(args));

	if (name == "reclaim_get_task_defaults")
		co_return co_await GetTaskDefaults();
	else if (name == "reclaim_list_tasks")
		co_return co_await ListTasks(args);
	else if (name == "reclaim_get_task")
		co_return co_await GetTask(args);
	else if (name == "reclaim_create_task")
		co_return co_await CreateTask(args);
	else if (name == "reclaim_update_task")
		co_return co_await UpdateTask(args);
	else if (name == "reclaim_delete_task")
		co_return co_await DeleteTask(args);
	else if (name == "reclaim_add_time")
		co_return co_await AddTime(args);
	else if (name == "reclaim_log_work")
		co_return co_await LogWork(args);

	throw JsonRpcError(JsonRpcErrorCode::INVALID_PARAMS,
			   fmt::format("Unknown tool: {}", name));
}

Co::Task<json>
ToolHandler::Call(std::string name, json arguments)
{
	if (FindTool(name) == nullptr)
		throw JsonRpcError(JsonRpcErrorCode::INVALID_PARAMS,
				   fmt::format("Unknown tool: {}", name));

	if (arguments.is_null())
		arguments = json::object();

	std::exception_ptr error;
	json result;

	try {
		result = co_await Invoke(name, arguments);
	} catch (...) {
		error = std::current_exception();
	}

	if (error)
		co_return MakeToolError(std::move(error));

	auto tool_result = MakeToolResult(result);

	if (name == "reclaim_list_tasks")
		AppendToolText(tool_result, list_status_note);
	else if (name == "reclaim_get_task")
		AppendToolText(tool_result, get_status_note);

	co_return tool_result;
}

json
ToolHandler::ListResources()
{
	return {
		{"resources", json::array({
					{
						{"uri", "tasks://active"},
						{"name", "reclaim_active_tasks"},
						{"title", "Active Reclaim Tasks"},
						{"description", "All active tasks: not deleted and neither ARCHIVED nor CANCELLED.  Tasks with status COMPLETE (scheduled time used up) are included."},
						{"mimeType", "application/json"},
					},
					{
						{"uri", "tasks://defaults"},
						{"name", "reclaim_task_defaults"},
						{"title", "Reclaim Task Defaults"},
						{"description", "Account-level task defaults (chunk sizes, priority, etc.)."},
						{"mimeType", "application/json"},
					},
				})},
	};
}

Co::Task<json>
ToolHandler::ReadResourceData(std::string_view uri)
{
	if (uri == "tasks://active")
		co_return FilterActiveTasks(co_await service.ListTasks());
	else if (uri == "tasks://defaults")
		co_return (co_await account.Get()).ToJson();

	throw JsonRpcError(JsonRpcErrorCode::RESOURCE_NOT_FOUND,
			   fmt::format("Resource not found: {}", uri));
}

Co::Task<json>
ToolHandler::ReadResource(std::string uri)
{
	json data;

	try {
		data = co_await ReadResourceData(uri);
	} catch (const JsonRpcError &) {
		throw;
	} catch (...) {
		std::throw_with_nested(std::runtime_error(fmt::format("Failed to fetch resource {}",
								      uri)));
	}

	co_return json{
		{"contents", json::array({
					{
						{"uri", uri},
						{"mimeType", "application/json"},
						{"text", data.dump(2)},
					},
				})},
	};
}

} // namespace Mcp
