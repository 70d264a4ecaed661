// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AccountDefaults.hxx"
#include "Enums.hxx"
#include "lib/nlohmann_json/Lookup.hxx"
#include "lib/nlohmann_json/String.hxx"

namespace Reclaim {

using json = nlohmann::json;

static std::optional<unsigned>
GetPositive(const json &j, std::string_view key) noexcept
{
	const auto *m = Json::Lookup(j, key);
	if (m == nullptr || !m->is_number_integer())
		return std::nullopt;

	const auto value = m->get<int64_t>();
	if (value <= 0 || value > 0xffff)
		return std::nullopt;

	return static_cast<unsigned>(value);
}

static std::optional<bool>
GetBool(const json &j, std::string_view key) noexcept
{
	const auto *m = Json::Lookup(j, key);
	if (m == nullptr || !m->is_boolean())
		return std::nullopt;

	return m->get<bool>();
}

static std::optional<std::string>
GetEnum(const json &j, std::string_view key, const EnumTable &table)
{
	const auto value = Json::GetStringRobust(j, key);
	if (value.empty())
		return std::nullopt;

	if (const auto canonical = Lookup(table, value))
		return std::string{*canonical};

	return std::nullopt;
}

AccountDefaults
AccountDefaults::FromUser(const json &user)
{
	AccountDefaults d;

	d.time_zone = Json::GetStringRobust(user, "timezone");
	if (d.time_zone.empty())
		d.time_zone = Json::GetString(Json::Lookup(user, "settings", "timezone"));

	const auto *defaults = Json::Lookup(user, "features", "taskSettings", "defaults");
	if (defaults == nullptr || !defaults->is_object())
		return d;

	d.raw = *defaults;

	d.category = GetEnum(*defaults, "eventCategory", category_table);
	if (!d.category)
		d.category = GetEnum(*defaults, "category", category_table);

	d.sub_type = GetEnum(*defaults, "eventSubType", sub_type_table);
	d.priority = GetEnum(*defaults, "priority", priority_table);

	if (const auto id = Json::GetStringRobust(*defaults, "timeSchemeId");
	    !id.empty())
		d.time_scheme_id = std::string{id};

	d.time_chunks_required = GetPositive(*defaults, "timeChunksRequired");
	d.min_chunk_size = GetPositive(*defaults, "minChunkSize");
	d.max_chunk_size = GetPositive(*defaults, "maxChunkSize");
	d.due_in_days = GetPositive(*defaults, "dueInDays");

	d.always_private = GetBool(*defaults, "alwaysPrivate");
	d.on_deck = GetBool(*defaults, "onDeck");

	return d;
}

json
AccountDefaults::ToJson() const
{
	json j = json::object();
	if (!time_zone.empty())
		j["timeZone"] = time_zone;

	j["taskDefaults"] = raw;
	return j;
}

} // namespace Reclaim
