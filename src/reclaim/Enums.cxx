// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Enums.hxx"
#include "util/CharUtil.hxx"
#include "util/StringStrip.hxx"

#include <algorithm>

using std::string_view_literals::operator""sv;

namespace Reclaim {

using Alias = std::pair<std::string_view, std::string_view>;

static constexpr std::string_view category_primary[] = {
	"WORK"sv, "PERSONAL"sv,
};

static constexpr Alias category_aliases[] = {
	{"BUSINESS"sv, "WORK"sv},
	{"JOB"sv, "WORK"sv},
	{"OFFICE"sv, "WORK"sv},
	{"PRIVATE"sv, "PERSONAL"sv},
	{"HOME"sv, "PERSONAL"sv},
	{"LIFE"sv, "PERSONAL"sv},
};

static constexpr std::string_view priority_primary[] = {
	"P1"sv, "P2"sv, "P3"sv, "P4"sv,
};

static constexpr Alias priority_aliases[] = {
	{"CRITICAL"sv, "P1"sv},
	{"URGENT"sv, "P1"sv},
	{"HIGHEST"sv, "P1"sv},
	{"HIGH"sv, "P2"sv},
	{"MEDIUM"sv, "P3"sv},
	{"NORMAL"sv, "P3"sv},
	{"DEFAULT"sv, "P3"sv},
	{"LOW"sv, "P4"sv},
	{"LOWEST"sv, "P4"sv},
};

static constexpr std::string_view personal_sub_types[] = {
	"VACATION"sv, "HEALTH"sv, "ERRAND"sv, "OTHER_PERSONAL"sv,
};

static constexpr std::string_view sub_type_primary[] = {
	"ONE_ON_ONE"sv, "STAFF_MEETING"sv, "OP_REVIEW"sv, "EXTERNAL"sv,
	"IDEATION"sv, "FOCUS"sv, "PRODUCTIVITY"sv, "TRAVEL"sv, "FLIGHT"sv,
	"TRAIN"sv,
	"VACATION"sv, "HEALTH"sv, "ERRAND"sv, "OTHER_PERSONAL"sv,
};

static constexpr Alias sub_type_aliases[] = {
	{"MEETING"sv, "STAFF_MEETING"sv},
	{"TEAM_MEETING"sv, "STAFF_MEETING"sv},
	{"STANDUP"sv, "STAFF_MEETING"sv},
	{"1:1"sv, "ONE_ON_ONE"sv},
	{"1ON1"sv, "ONE_ON_ONE"sv},
	{"1_ON_1"sv, "ONE_ON_ONE"sv},
	{"REVIEW"sv, "OP_REVIEW"sv},
	{"CUSTOMER"sv, "EXTERNAL"sv},
	{"CLIENT"sv, "EXTERNAL"sv},
	{"BRAINSTORM"sv, "IDEATION"sv},
	{"BRAINSTORMING"sv, "IDEATION"sv},
	{"DEEP_WORK"sv, "FOCUS"sv},
	{"HEADS_DOWN"sv, "FOCUS"sv},
	{"ADMIN"sv, "PRODUCTIVITY"sv},
	{"COMMUTE"sv, "TRAVEL"sv},
	{"HOLIDAY"sv, "VACATION"sv},
	{"PTO"sv, "VACATION"sv},
	{"DOCTOR"sv, "HEALTH"sv},
	{"EXERCISE"sv, "HEALTH"sv},
	{"WORKOUT"sv, "HEALTH"sv},
	{"CHORE"sv, "ERRAND"sv},
	{"CHORES"sv, "ERRAND"sv},
	{"PERSONAL"sv, "OTHER_PERSONAL"sv},
};

static constexpr std::string_view color_primary[] = {
	"LAVENDER"sv, "SAGE"sv, "GRAPE"sv, "FLAMINGO"sv, "BANANA"sv,
	"TANGERINE"sv, "PEACOCK"sv, "GRAPHITE"sv, "BLUEBERRY"sv,
	"BASIL"sv, "TOMATO"sv,
};

static constexpr Alias color_aliases[] = {
	{"PURPLE"sv, "GRAPE"sv},
	{"VIOLET"sv, "LAVENDER"sv},
	{"PINK"sv, "FLAMINGO"sv},
	{"YELLOW"sv, "BANANA"sv},
	{"ORANGE"sv, "TANGERINE"sv},
	{"TEAL"sv, "PEACOCK"sv},
	{"CYAN"sv, "PEACOCK"sv},
	{"GRAY"sv, "GRAPHITE"sv},
	{"GREY"sv, "GRAPHITE"sv},
	{"BLUE"sv, "BLUEBERRY"sv},
	{"GREEN"sv, "BASIL"sv},
	{"LIGHT_GREEN"sv, "SAGE"sv},
	{"RED"sv, "TOMATO"sv},
};

static constexpr std::string_view status_primary[] = {
	"NEW"sv, "SCHEDULED"sv, "IN_PROGRESS"sv, "COMPLETE"sv,
	"CANCELLED"sv, "ARCHIVED"sv,
};

static constexpr Alias status_aliases[] = {
	{"CANCELED"sv, "CANCELLED"sv},
	{"INPROGRESS"sv, "IN_PROGRESS"sv},
	{"COMPLETED"sv, "COMPLETE"sv},
};

const EnumTable category_table{category_primary, category_aliases};
const EnumTable priority_table{priority_primary, priority_aliases};
const EnumTable sub_type_table{sub_type_primary, sub_type_aliases};
const EnumTable color_table{color_primary, color_aliases};
const EnumTable status_table{status_primary, status_aliases};

std::string
CanonicalizeToken(std::string_view s)
{
	s = Strip(s);

	std::string result;
	result.reserve(s.size());

	for (char ch : s) {
		if (ch == ' ' || ch == '-')
			ch = '_';
		else
			ch = ToUpperASCII(ch);

		result.push_back(ch);
	}

	return result;
}

std::optional<std::string_view>
Lookup(const EnumTable &table, std::string_view value)
{
	const auto token = CanonicalizeToken(value);
	if (token.empty())
		return std::nullopt;

	if (const auto i = std::find(table.primary.begin(),
				     table.primary.end(), token);
	    i != table.primary.end())
		return *i;

	for (const auto &[alias, canonical] : table.aliases)
		if (alias == token)
			return canonical;

	return std::nullopt;
}

bool
IsPersonalSubType(std::string_view sub_type) noexcept
{
	return std::find(std::begin(personal_sub_types),
			 std::end(personal_sub_types),
			 sub_type) != std::end(personal_sub_types);
}

std::string_view
InferCategory(std::string_view sub_type) noexcept
{
	return IsPersonalSubType(sub_type) ? "PERSONAL"sv : "WORK"sv;
}

std::string_view
DefaultSubType(std::string_view category) noexcept
{
	return category == "PERSONAL"sv ? "OTHER_PERSONAL"sv : "FOCUS"sv;
}

} // namespace Reclaim
